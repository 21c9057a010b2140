#pragma once

#include "collectors/IProcessCollector.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace vigil::app {

inline constexpr int kExitOk = 0;
inline constexpr int kExitScanFailed = 1;  // a scan hit a fatal source/collector error
inline constexpr int kExitUsage = 2;       // bad command line or unreadable config
inline constexpr int kExitSinkFailed = 2;  // the findings log cannot be written

struct CliOptions {
  std::string scan = "all";
  std::string config_path;
  std::optional<std::string> data_dir;
  std::optional<std::string> log_file;
  std::optional<std::string> policy;
  std::optional<std::string> inventory;
  bool quiet{false};
  bool help{false};
};

void print_usage(std::ostream& os);

// Parse arguments (argv[1..]). Returns std::nullopt after reporting an
// unexpected argument on stderr.
[[nodiscard]] std::optional<CliOptions> parse_cli_args(const std::vector<std::string>& args);

// Full command: parse, load configuration, run the selected scans.
// `collector` backs the live process scan. Returns the process exit code.
[[nodiscard]] int run_cli(const std::vector<std::string>& args, collectors::IProcessCollector& collector);

} // namespace vigil::app
