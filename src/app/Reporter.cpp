#include "app/Reporter.hpp"
#include "app/Errors.hpp"
#include "app/LogScanner.hpp"
#include "app/RecordSource.hpp"

#include <cstdio>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace vigil::app {

using model::RiskTier;
using model::RiskVerdict;

std::string format_verdict_line(const RiskVerdict& v, std::string_view detail) {
  std::ostringstream os;
  os << v.subject << ": " << model::tier_name(v.tier);
  if (!v.reason.empty()) os << " [" << v.reason << ']';
  if (!detail.empty()) os << ' ' << detail;
  return os.str();
}

std::string format_summary(const model::VerdictSummary& s) {
  static constexpr RiskTier order[] = {RiskTier::CRITICAL, RiskTier::HIGH, RiskTier::MEDIUM,
                                       RiskTier::WARNING, RiskTier::LOW, RiskTier::OK};
  std::ostringstream os;
  bool first = true;
  for (auto t : order) {
    if (!first) os << ' ';
    first = false;
    os << model::tier_name(t) << '=' << s.count(t);
  }
  return os.str();
}

AnomalyReporter::AnomalyReporter(LogSink& sink) : sink_(sink) {}

void AnomalyReporter::emit(ScanResult& r, RiskVerdict v, std::string_view detail) {
  const LogLevel level = model::is_finding(v.tier) ? LogLevel::Warning : LogLevel::Info;
  sink_.append(level, format_verdict_line(v, detail));
  r.verdicts.push_back(std::move(v));
}

ScanResult AnomalyReporter::fail(ScanResult r, std::string_view scan, const std::exception& e) {
  r.exit_code = 1;
  r.summary = model::summarize(r.verdicts);
  std::fprintf(stderr, "vigil: %.*s aborted: %s\n", static_cast<int>(scan.size()), scan.data(), e.what());
  sink_.error(std::string(scan) + " aborted: " + e.what());
  return r;
}

ScanResult AnomalyReporter::fail_or_skip(ScanResult r, std::string_view scan, const SourceError& e,
                                         InputMode mode) {
  if (mode == InputMode::Required || e.kind != SourceErrorKind::NotFound) {
    return fail(std::move(r), scan, e);
  }
  r.skipped = true;
  sink_.info(std::string(scan) + " skipped: " + e.path.string() + " missing (optional)");
  return r;
}

ScanResult AnomalyReporter::finish(ScanResult r, std::string_view scan, std::string_view noun) {
  r.summary = model::summarize(r.verdicts);
  std::ostringstream os;
  os << scan << " completed: " << r.summary.total() << ' ' << noun << ", "
     << r.summary.findings() << " findings (" << format_summary(r.summary) << ')';
  if (r.rejected_rows) os << ", " << r.rejected_rows << " rejected rows";
  sink_.info(os.str());
  return r;
}

template <typename T>
void AnomalyReporter::log_rejected(ScanResult& r, const model::SourceRows<T>& rows, std::string_view source) {
  for (const auto& row : rows) {
    if (row.ok()) continue;
    ++r.rejected_rows;
    std::ostringstream os;
    os << "Skipped " << source << " row " << row.row << ": " << row.error;
    sink_.warning(os.str());
  }
}

// ---------------------------------------------------------------------------

ScanResult AnomalyReporter::run_roster_scan(const fs::path& roster, const InactivityPolicy& policy) {
  static constexpr std::string_view scan = "User inactivity scan";
  ScanResult r;
  sink_.info(std::string(scan) + " started: " + roster.string() + " (policy " + policy.name() + ")");

  model::SourceRows<model::UserRecord> rows;
  try {
    rows = load_user_roster(roster);
  } catch (const SourceError& e) {
    return fail(std::move(r), scan, e);
  }

  // Rejected rows are reported where they occur so the log follows the file
  for (const auto& row : rows) {
    if (!row.ok()) {
      ++r.rejected_rows;
      sink_.warning("Skipped " + roster.filename().string() + " row " + std::to_string(row.row) + ": " + row.error);
      continue;
    }
    emit(r, classify_inactivity(*row.record, policy));
  }
  return finish(std::move(r), scan, "users");
}

ScanResult AnomalyReporter::run_failed_login_scan(const fs::path& roster, const fs::path& events,
                                                  const FailedLoginPolicy& policy) {
  static constexpr std::string_view scan = "Failed login scan";
  ScanResult r;
  sink_.info(std::string(scan) + " started: " + roster.string() + " + " + events.string());

  model::SourceRows<model::UserRecord> users;
  model::SourceRows<model::EventRecord> feed;
  try {
    users = load_user_roster(roster);
    feed = load_event_feed(events);
  } catch (const SourceError& e) {
    return fail(std::move(r), scan, e);
  }
  log_rejected(r, users, roster.filename().string());
  log_rejected(r, feed, events.filename().string());

  std::unordered_set<std::string> known;
  for (const auto& u : users) {
    if (u.ok()) known.insert(u.record->username);
  }
  std::vector<model::EventRecord> parsed;
  parsed.reserve(feed.size());
  for (const auto& e : feed) {
    if (e.ok()) parsed.push_back(*e.record);
  }

  const auto tally = count_failed_logins(parsed, known, policy);
  for (const auto& u : users) {
    if (!u.ok()) continue;
    const auto& user = *u.record;
    const int fails = tally.count_for(user.username);
    emit(r, classify_failed_logins(user, fails, policy),
         "(fails=" + std::to_string(fails) + ", status=" + model::status_name(user.status) + ")");
  }
  if (tally.unknown_user_events) {
    sink_.info("Ignored " + std::to_string(tally.unknown_user_events) + " " + policy.event_type +
               " events for users not in " + roster.filename().string());
  }
  return finish(std::move(r), scan, "users");
}

ScanResult AnomalyReporter::denylist_scan(ScanResult r, std::string_view scan,
                                          const std::vector<model::ProcessRecord>& procs,
                                          const Denylist& denylist) {
  std::unordered_set<std::string> seen;
  for (const auto& p : procs) {
    if (!denylist.match(p.name) || !seen.insert(p.name).second) continue;
    emit(r, RiskVerdict{p.name, RiskTier::WARNING, "denylisted process"},
         p.pid > 0 ? "(pid " + std::to_string(p.pid) + ")" : std::string());
  }
  if (r.verdicts.empty()) {
    sink_.info("No known risk processes detected (" + denylist.joined() + ")");
  }
  return finish(std::move(r), scan, "matches");
}

ScanResult AnomalyReporter::run_process_scan(collectors::IProcessCollector& collector,
                                             const Denylist& denylist, const fs::path& inventory_out) {
  static constexpr std::string_view scan = "Process denylist scan";
  ScanResult r;
  sink_.info(std::string(scan) + " started: " + collector.name());

  if (!collector.init()) {
    return fail(std::move(r), scan, CollectorError(std::string(collector.name()) + " unavailable"));
  }
  std::vector<model::ProcessRecord> procs;
  try {
    procs = collector.list_processes();
  } catch (const CollectorError& e) {
    return fail(std::move(r), scan, e);
  }
  if (procs.empty()) {
    sink_.warning("Process list empty (unexpected)");
  }
  if (!inventory_out.empty()) {
    // The export is a by-product; the denylist check still runs without it
    try {
      write_process_inventory(inventory_out, procs);
      sink_.info("Wrote process inventory: " + inventory_out.string() + " (" +
                 std::to_string(procs.size()) + " processes)");
    } catch (const ExportError& e) {
      std::fprintf(stderr, "vigil: %s\n", e.what());
      sink_.warning(std::string("Process inventory not written: ") + e.what());
    }
  }
  return denylist_scan(std::move(r), scan, procs, denylist);
}

ScanResult AnomalyReporter::run_process_inventory_scan(const fs::path& inventory, const Denylist& denylist) {
  static constexpr std::string_view scan = "Process denylist scan";
  ScanResult r;
  sink_.info(std::string(scan) + " started: " + inventory.string());

  model::SourceRows<model::ProcessRecord> rows;
  try {
    rows = load_process_inventory(inventory);
  } catch (const SourceError& e) {
    return fail(std::move(r), scan, e);
  }
  log_rejected(r, rows, inventory.filename().string());

  std::vector<model::ProcessRecord> procs;
  procs.reserve(rows.size());
  for (const auto& row : rows) {
    if (row.ok()) procs.push_back(*row.record);
  }
  return denylist_scan(std::move(r), scan, procs, denylist);
}

ScanResult AnomalyReporter::run_service_scan(const fs::path& services, const Denylist& denylist,
                                             InputMode mode) {
  static constexpr std::string_view scan = "Service denylist scan";
  ScanResult r;
  sink_.info(std::string(scan) + " started: " + services.string());

  model::SourceRows<model::ServiceRecord> rows;
  try {
    rows = load_service_listing(services);
  } catch (const SourceError& e) {
    return fail_or_skip(std::move(r), scan, e, mode);
  }
  log_rejected(r, rows, services.filename().string());

  std::unordered_set<std::string> seen;
  for (const auto& row : rows) {
    if (!row.ok()) continue;
    const auto& svc = *row.record;
    if (!denylist.match(svc.name) || !seen.insert(svc.name).second) continue;
    emit(r, RiskVerdict{svc.name, RiskTier::WARNING, "denylisted service"},
         svc.status.empty() ? std::string() : "(Status=" + svc.status + ")");
  }
  if (r.verdicts.empty()) {
    sink_.info("No risky services detected (" + denylist.joined() + ")");
  }
  return finish(std::move(r), scan, "matches");
}

ScanResult AnomalyReporter::run_auth_log_scan(const fs::path& log, const AddressPolicy& policy,
                                              InputMode mode) {
  static constexpr std::string_view scan = "Auth log scan";
  ScanResult r;
  sink_.info(std::string(scan) + " started: " + log.string());

  std::vector<std::string> lines;
  try {
    lines = load_text_lines(log);
  } catch (const SourceError& e) {
    return fail_or_skip(std::move(r), scan, e, mode);
  }

  const LogScanner scanner;
  const LogScanSummary summary = scanner.scan(lines);
  for (const auto& [address, count] : summary.ranked_addresses()) {
    emit(r, classify_address(address, count, policy), "(" + std::to_string(count) + " fails)");
  }
  if (summary.address_failures.empty()) {
    sink_.info("No failed-login address indicators found");
  }
  std::ostringstream os;
  os << "Auth log indicators: failed=" << summary.failed << ", error=" << summary.error
     << ", unauthorized=" << summary.unauthorized << " (" << summary.lines << " lines)";
  sink_.info(os.str());
  return finish(std::move(r), scan, "addresses");
}

} // namespace vigil::app
