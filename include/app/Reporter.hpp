#pragma once

#include "app/Denylist.hpp"
#include "app/Errors.hpp"
#include "app/LogSink.hpp"
#include "app/RiskClassifier.hpp"
#include "collectors/IProcessCollector.hpp"
#include "model/Records.hpp"
#include "model/Verdict.hpp"
#include <exception>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::app {

// Optional inputs may be absent: the scan is skipped with an INFO line
// instead of failing. Other source errors stay fatal.
enum class InputMode { Required, Optional };

struct ScanResult {
  int exit_code{0};                         // 0 ok, 1 fatal source/collector error
  bool skipped{false};                      // optional input was missing
  std::vector<model::RiskVerdict> verdicts; // in log order
  model::VerdictSummary summary;
  size_t rejected_rows{0};

  [[nodiscard]] bool ok() const { return exit_code == 0; }
};

// "<subject>: <TIER> [<reason>]" plus an optional trailing detail.
[[nodiscard]] std::string format_verdict_line(const model::RiskVerdict& v, std::string_view detail = {});

// "CRITICAL=1 HIGH=0 MEDIUM=1 WARNING=0 LOW=0 OK=1"
[[nodiscard]] std::string format_summary(const model::VerdictSummary& s);

// Drives one scan from its record source to the log sink. Each run writes a
// start line, one line per record in source order, and a closing summary;
// a fatal input error ends the run with a single ERROR line instead of the
// summary. SinkError is never caught here.
class AnomalyReporter {
public:
  explicit AnomalyReporter(LogSink& sink);

  // Inactivity policy over users.csv
  ScanResult run_roster_scan(const std::filesystem::path& roster, const InactivityPolicy& policy);

  // Failed-login policy: users.csv status x events.json failures
  ScanResult run_failed_login_scan(const std::filesystem::path& roster,
                                   const std::filesystem::path& events,
                                   const FailedLoginPolicy& policy);

  // Live process denylist; writes the enumerated list to inventory_out unless it is empty
  ScanResult run_process_scan(collectors::IProcessCollector& collector, const Denylist& denylist,
                              const std::filesystem::path& inventory_out = {});

  // Process denylist over a previously exported inventory
  ScanResult run_process_inventory_scan(const std::filesystem::path& inventory, const Denylist& denylist);

  // Service denylist over a service export CSV
  ScanResult run_service_scan(const std::filesystem::path& services, const Denylist& denylist,
                              InputMode mode = InputMode::Required);

  // Keyword tallies and per-address failed logins over an auth log
  ScanResult run_auth_log_scan(const std::filesystem::path& log, const AddressPolicy& policy,
                               InputMode mode = InputMode::Required);

private:
  LogSink& sink_;

  void emit(ScanResult& r, model::RiskVerdict v, std::string_view detail = {});
  ScanResult fail(ScanResult r, std::string_view scan, const std::exception& e);
  ScanResult fail_or_skip(ScanResult r, std::string_view scan, const SourceError& e, InputMode mode);
  ScanResult finish(ScanResult r, std::string_view scan, std::string_view noun);
  ScanResult denylist_scan(ScanResult r, std::string_view scan,
                           const std::vector<model::ProcessRecord>& procs, const Denylist& denylist);

  template <typename T>
  void log_rejected(ScanResult& r, const model::SourceRows<T>& rows, std::string_view source);
};

} // namespace vigil::app
