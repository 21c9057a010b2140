#include "app/Config.hpp"
#include "app/Denylist.hpp"
#include "util/Csv.hpp"
#include "util/TomlReader.hpp"

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace vigil::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("VIGIL_", 0) == 0) {
    alt = std::string("vigil_") + n.substr(6);
  } else if (n.rfind("vigil_", 0) == 0) {
    alt = std::string("VIGIL_") + n.substr(6);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  std::string_view s(v);
  int out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc{} || ptr != s.data() + s.size()) {
    std::fprintf(stderr, "vigil: ignoring %s=%s (not an integer)\n", name, v);
    return defv;
  }
  return out;
}

static bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/vigil/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/vigil/config.toml";
  return {};
}

std::filesystem::path Config::resolve(const std::string& p) const {
  std::filesystem::path path(p);
  if (path.is_absolute() || paths.data_dir.empty()) return path;
  return std::filesystem::path(paths.data_dir) / path;
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

// Resolve a name list from TOML (array or comma string) -> env (comma string) -> default
static std::vector<std::string> resolve_list(const util::TomlReader& toml, bool have_toml,
                                             const char* section, const char* key,
                                             const char* env_name, const std::vector<std::string>& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_list(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return util::split_list(v);
  }
  return def;
}

// Thresholds must be positive
static int positive_or(int value, int def, const char* what) {
  if (value > 0) return value;
  std::fprintf(stderr, "vigil: %s must be positive (got %d), using %d\n", what, value, def);
  return def;
}

std::optional<Config> load_config(const std::string& explicit_path) {
  Config c{};
  util::TomlReader toml;
  bool have_toml = false;
  if (!explicit_path.empty()) {
    if (!toml.load(explicit_path)) {
      std::fprintf(stderr, "vigil: cannot read config %s\n", explicit_path.c_str());
      return std::nullopt;
    }
    have_toml = true;
  } else {
    auto path = config_file_path();
    have_toml = !path.empty() && toml.load(path);
  }

  // --- [paths] ---
  const PathsConfig defaults{};
  c.paths.data_dir          = resolve_string(toml, have_toml, "paths", "data_dir",          "VIGIL_DATA_DIR", defaults.data_dir);
  c.paths.roster            = resolve_string(toml, have_toml, "paths", "roster",            "VIGIL_ROSTER", defaults.roster);
  c.paths.events            = resolve_string(toml, have_toml, "paths", "events",            "VIGIL_EVENTS", defaults.events);
  c.paths.services          = resolve_string(toml, have_toml, "paths", "services",          "VIGIL_SERVICES", defaults.services);
  c.paths.auth_log          = resolve_string(toml, have_toml, "paths", "auth_log",          "VIGIL_AUTH_LOG", defaults.auth_log);
  c.paths.log_file          = resolve_string(toml, have_toml, "paths", "log_file",          "VIGIL_LOG_FILE", defaults.log_file);
  c.paths.process_inventory = resolve_string(toml, have_toml, "paths", "process_inventory", "VIGIL_PROCESS_INVENTORY", defaults.process_inventory);

  // --- [inactivity] ---
  const InactivityPolicy base{};
  int high_days   = positive_or(resolve_int(toml, have_toml, "inactivity", "high_days",   "VIGIL_HIGH_DAYS", base.high_days), base.high_days, "inactivity.high_days");
  int medium_days = positive_or(resolve_int(toml, have_toml, "inactivity", "medium_days", "VIGIL_MEDIUM_DAYS", base.medium_days), base.medium_days, "inactivity.medium_days");
  int recent_days = positive_or(resolve_int(toml, have_toml, "inactivity", "recent_days", "VIGIL_RECENT_DAYS", 30), 30, "inactivity.recent_days");
  if (medium_days >= high_days) {
    std::fprintf(stderr, "vigil: inactivity.medium_days (%d) must be below high_days (%d), using %d/%d\n",
                 medium_days, high_days, base.medium_days, base.high_days);
    high_days = base.high_days;
    medium_days = base.medium_days;
  }
  std::string policy_name = resolve_string(toml, have_toml, "inactivity", "policy", "VIGIL_INACTIVITY_POLICY", "any_disabled");
  if (auto p = inactivity_policy_from_name(policy_name, recent_days)) {
    c.inactivity = *p;
  } else {
    std::fprintf(stderr, "vigil: unknown inactivity policy '%s', using any_disabled\n", policy_name.c_str());
    c.inactivity = InactivityPolicy::any_disabled();
  }
  c.recent_days = recent_days;
  c.inactivity.high_days = high_days;
  c.inactivity.medium_days = medium_days;

  // --- [failed_login] / [auth_log] ---
  c.failed_login.high_count = positive_or(resolve_int(toml, have_toml, "failed_login", "high_count", "VIGIL_FAILED_HIGH_COUNT", 3), 3, "failed_login.high_count");
  c.failed_login.event_type = resolve_string(toml, have_toml, "failed_login", "event_type", nullptr, "failed_login");
  c.address.brute_force_count = positive_or(resolve_int(toml, have_toml, "auth_log", "brute_force_count", "VIGIL_BRUTE_FORCE_COUNT", 5), 5, "auth_log.brute_force_count");

  // --- [denylist] ---
  c.process_denylist = resolve_list(toml, have_toml, "denylist", "processes", "VIGIL_PROCESS_DENYLIST", default_process_denylist());
  c.service_denylist = resolve_list(toml, have_toml, "denylist", "services",  "VIGIL_SERVICE_DENYLIST", default_service_denylist());

  // --- [output] ---
  c.echo = resolve_bool(toml, have_toml, "output", "echo", "VIGIL_ECHO", true);

  return c;
}

} // namespace vigil::app
