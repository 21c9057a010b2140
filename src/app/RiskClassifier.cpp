#include "app/RiskClassifier.hpp"
#include "util/AsciiLower.hpp"

#include <numeric>

namespace vigil::app {

using model::RiskTier;
using model::RiskVerdict;
using model::UserStatus;

InactivityPolicy InactivityPolicy::any_disabled() {
  return InactivityPolicy{};
}

InactivityPolicy InactivityPolicy::recent_login_guard(int recent_days) {
  InactivityPolicy p;
  p.disabled_recent_days = recent_days;
  return p;
}

const char* InactivityPolicy::name() const {
  return disabled_recent_days ? "recent_login_guard" : "any_disabled";
}

std::optional<InactivityPolicy> inactivity_policy_from_name(std::string_view name, int recent_days) {
  std::string n = util::ascii_lower_copy(name);
  for (auto& c : n) if (c == '-') c = '_';
  if (n == "any_disabled") return InactivityPolicy::any_disabled();
  if (n == "recent_login_guard") return InactivityPolicy::recent_login_guard(recent_days);
  return std::nullopt;
}

RiskVerdict classify_inactivity(const model::UserRecord& user, const InactivityPolicy& policy) {
  const bool disabled = user.status == UserStatus::Disabled;
  const int days = user.last_login_days;
  const std::string high = std::to_string(policy.high_days);

  if (days > policy.high_days && disabled)
    return {user.username, RiskTier::CRITICAL, "inactive > " + high + " days & disabled"};
  if (days > policy.high_days)
    return {user.username, RiskTier::HIGH, "inactive > " + high + " days"};
  if (days > policy.medium_days)
    return {user.username, RiskTier::MEDIUM, "inactive > " + std::to_string(policy.medium_days) + " days"};
  if (disabled && (!policy.disabled_recent_days || days < *policy.disabled_recent_days))
    return {user.username, RiskTier::WARNING, "disabled but recently active"};
  return {user.username, RiskTier::OK, {}};
}

RiskVerdict classify_failed_logins(const model::UserRecord& user, int fail_count,
                                   const FailedLoginPolicy& policy) {
  // disabled + any failure outranks the count-based tiers
  if (fail_count >= 1 && user.status == UserStatus::Disabled)
    return {user.username, RiskTier::CRITICAL, "disabled + failed logins"};
  if (fail_count >= policy.high_count)
    return {user.username, RiskTier::HIGH, std::to_string(policy.high_count) + "+ failed attempts"};
  if (fail_count >= 1)
    return {user.username, RiskTier::MEDIUM, "failed attempts"};
  return {user.username, RiskTier::LOW, "no failed attempts"};
}

RiskVerdict classify_address(const std::string& address, int fail_count, const AddressPolicy& policy) {
  if (fail_count >= policy.brute_force_count)
    return {address, RiskTier::CRITICAL, "brute-force indicator"};
  if (fail_count >= 1)
    return {address, RiskTier::MEDIUM, "suspicious failed logins"};
  return {address, RiskTier::LOW, {}};
}

FailedLoginTally count_failed_logins(const std::vector<model::EventRecord>& events,
                                     const std::unordered_set<std::string>& known_users,
                                     const FailedLoginPolicy& policy) {
  return std::accumulate(events.begin(), events.end(), FailedLoginTally{},
    [&](FailedLoginTally acc, const model::EventRecord& e){
      if (e.event_type != policy.event_type) return acc;
      ++acc.matching_events;
      if (known_users.count(e.user)) ++acc.per_user[e.user];
      else ++acc.unknown_user_events;
      return acc;
    });
}

} // namespace vigil::app
