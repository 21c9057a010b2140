#pragma once

#include "app/RiskClassifier.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vigil::app {

struct PathsConfig {
  std::string data_dir = "data";
  std::string roster = "users.csv";
  std::string events = "events.json";
  std::string services = "windows_services.csv";
  std::string auth_log = "auth.log";
  std::string log_file = "anomalies.log";
  std::string process_inventory = "linux_processes.json";  // empty disables the export
};

struct Config {
  PathsConfig paths;
  InactivityPolicy inactivity;
  int recent_days{30};  // guard used when recent_login_guard is selected
  FailedLoginPolicy failed_login;
  AddressPolicy address;
  std::vector<std::string> process_denylist;
  std::vector<std::string> service_denylist;
  bool echo{true};

  // Relative paths live under data_dir; absolute paths are used as given.
  [[nodiscard]] std::filesystem::path resolve(const std::string& p) const;
};

// $XDG_CONFIG_HOME/vigil/config.toml, else ~/.config/vigil/config.toml
[[nodiscard]] std::string config_file_path();

// Build the configuration from TOML -> environment -> compiled defaults.
// explicit_path empty: the default config file is used if present.
// Returns std::nullopt only when an explicitly named file cannot be read.
[[nodiscard]] std::optional<Config> load_config(const std::string& explicit_path = {});

// Environment helpers (VIGIL_* with a lowercase vigil_* fallback)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace vigil::app
