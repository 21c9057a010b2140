#include "app/Cli.hpp"
#include "app/Config.hpp"
#include "app/Denylist.hpp"
#include "app/Errors.hpp"
#include "app/LogSink.hpp"
#include "app/Reporter.hpp"
#include "app/RiskClassifier.hpp"

#include <cstdio>
#include <iostream>

namespace vigil::app {

void print_usage(std::ostream& os) {
  os << "Usage: vigil [all|roster|logins|procs|services|authlog] [options]\n"
        "\n"
        "Scans:\n"
        "  roster     inactive or disabled accounts in the user roster\n"
        "  logins     failed-login events correlated with account status\n"
        "  procs      running processes against the process denylist\n"
        "  services   service export against the service denylist\n"
        "  authlog    failed/error/unauthorized indicators and per-address failures\n"
        "  all        every scan above (default); services and authlog inputs are optional\n"
        "\n"
        "Options:\n"
        "  --config PATH        TOML config (default: $XDG_CONFIG_HOME/vigil/config.toml)\n"
        "  --data-dir DIR       directory holding inputs and the log\n"
        "  --log-file PATH      findings log (default: anomalies.log)\n"
        "  --policy NAME        any_disabled | recent_login_guard\n"
        "  --inventory PATH     procs: scan a process inventory JSON instead of /proc\n"
        "  --quiet              do not mirror log lines to stdout\n"
        "  -h, --help           show this help\n";
}

static bool is_scan_name(const std::string& s) {
  return s == "all" || s == "roster" || s == "logins" || s == "procs" || s == "services" || s == "authlog";
}

std::optional<CliOptions> parse_cli_args(const std::vector<std::string>& args) {
  CliOptions o;
  bool scan_given = false;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    const bool has_value = i + 1 < args.size();
    if (a == "--config" && has_value) o.config_path = args[++i];
    else if (a == "--data-dir" && has_value) o.data_dir = args[++i];
    else if (a == "--log-file" && has_value) o.log_file = args[++i];
    else if (a == "--policy" && has_value) o.policy = args[++i];
    else if (a == "--inventory" && has_value) o.inventory = args[++i];
    else if (a == "--quiet" || a == "-q") o.quiet = true;
    else if (a == "-h" || a == "--help") o.help = true;
    else if (!scan_given && is_scan_name(a)) { o.scan = a; scan_given = true; }
    else {
      std::fprintf(stderr, "vigil: unexpected argument '%s'\n", a.c_str());
      return std::nullopt;
    }
  }
  return o;
}

int run_cli(const std::vector<std::string>& args, collectors::IProcessCollector& collector) {
  auto opts = parse_cli_args(args);
  if (!opts) {
    print_usage(std::cerr);
    return kExitUsage;
  }
  if (opts->help) {
    print_usage(std::cout);
    return kExitOk;
  }

  auto cfg = load_config(opts->config_path);
  if (!cfg) return kExitUsage;
  if (opts->data_dir) cfg->paths.data_dir = *opts->data_dir;
  if (opts->log_file) cfg->paths.log_file = *opts->log_file;
  if (opts->quiet) cfg->echo = false;
  if (opts->policy) {
    auto p = inactivity_policy_from_name(*opts->policy, cfg->recent_days);
    if (!p) {
      std::fprintf(stderr, "vigil: unknown policy '%s' (expected any_disabled or recent_login_guard)\n",
                   opts->policy->c_str());
      return kExitUsage;
    }
    p->high_days = cfg->inactivity.high_days;
    p->medium_days = cfg->inactivity.medium_days;
    cfg->inactivity = *p;
  }

  const std::string& scan = opts->scan;
  const bool all = scan == "all";
  // A Linux host usually has no service export and may have no auth.log;
  // under "all" their absence is reported, not failed.
  const InputMode secondary = all ? InputMode::Optional : InputMode::Required;
  int rc = kExitOk;
  try {
    LogSink sink(cfg->resolve(cfg->paths.log_file), cfg->echo);
    AnomalyReporter reporter(sink);
    auto record = [&rc](const ScanResult& r){ if (!r.ok()) rc = kExitScanFailed; };

    if (all || scan == "roster") {
      record(reporter.run_roster_scan(cfg->resolve(cfg->paths.roster), cfg->inactivity));
    }
    if (all || scan == "logins") {
      record(reporter.run_failed_login_scan(cfg->resolve(cfg->paths.roster),
                                            cfg->resolve(cfg->paths.events), cfg->failed_login));
    }
    if (all || scan == "procs") {
      auto denylist = Denylist::for_processes(cfg->process_denylist);
      if (opts->inventory) {
        record(reporter.run_process_inventory_scan(*opts->inventory, denylist));
      } else {
        const std::string& inv = cfg->paths.process_inventory;
        record(reporter.run_process_scan(collector, denylist,
                                         inv.empty() ? std::filesystem::path() : cfg->resolve(inv)));
      }
    }
    if (all || scan == "services") {
      record(reporter.run_service_scan(cfg->resolve(cfg->paths.services),
                                       Denylist::for_services(cfg->service_denylist), secondary));
    }
    if (all || scan == "authlog") {
      record(reporter.run_auth_log_scan(cfg->resolve(cfg->paths.auth_log), cfg->address, secondary));
    }
  } catch (const SinkError& e) {
    std::fprintf(stderr, "vigil: log sink failed: %s\n", e.what());
    return kExitSinkFailed;
  }
  std::fflush(stdout);
  return rc;
}

} // namespace vigil::app
