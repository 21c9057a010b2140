#pragma once

#include "model/Records.hpp"
#include "model/Verdict.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace vigil::app {

// Inactivity rules over a roster entry, first match wins:
//   days > high_days && disabled  -> CRITICAL
//   days > high_days              -> HIGH
//   days > medium_days            -> MEDIUM
//   disabled [&& days < recent]   -> WARNING
//   otherwise                     -> OK
// The two shipped variants differ only in the guard on the disabled rule.
struct InactivityPolicy {
  int high_days = 180;
  int medium_days = 90;
  // When set, a disabled account only warns if it logged in fewer than this many days ago.
  std::optional<int> disabled_recent_days;

  [[nodiscard]] static InactivityPolicy any_disabled();
  [[nodiscard]] static InactivityPolicy recent_login_guard(int recent_days = 30);

  [[nodiscard]] const char* name() const;
};

// Parses "any_disabled" / "recent_login_guard" (also accepts '-' for '_').
[[nodiscard]] std::optional<InactivityPolicy> inactivity_policy_from_name(std::string_view name,
                                                                         int recent_days = 30);

struct FailedLoginPolicy {
  int high_count = 3;
  std::string event_type = "failed_login";
};

// Failed-login counts per source address (auth log).
struct AddressPolicy {
  int brute_force_count = 5;
};

[[nodiscard]] model::RiskVerdict classify_inactivity(const model::UserRecord& user,
                                                     const InactivityPolicy& policy);

[[nodiscard]] model::RiskVerdict classify_failed_logins(const model::UserRecord& user, int fail_count,
                                                        const FailedLoginPolicy& policy);

[[nodiscard]] model::RiskVerdict classify_address(const std::string& address, int fail_count,
                                                  const AddressPolicy& policy);

struct FailedLoginTally {
  std::unordered_map<std::string, int> per_user;
  size_t matching_events{};      // events of the counted type
  size_t unknown_user_events{};  // counted-type events for users outside the roster

  [[nodiscard]] int count_for(const std::string& user) const {
    auto it = per_user.find(user);
    return it == per_user.end() ? 0 : it->second;
  }
};

// Fold the event feed into per-user counts of policy.event_type.
[[nodiscard]] FailedLoginTally count_failed_logins(const std::vector<model::EventRecord>& events,
                                                   const std::unordered_set<std::string>& known_users,
                                                   const FailedLoginPolicy& policy);

} // namespace vigil::app
