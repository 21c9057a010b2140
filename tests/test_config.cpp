#include "minitest.hpp"
#include "app/Config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using vigil::app::Config;
using vigil::app::load_config;

static fs::path config_home(const char* suffix) {
  auto dir = fs::temp_directory_path() /
             ("vigil_config_test_" + std::to_string(::getpid()) + "_" + suffix);
  fs::remove_all(dir);
  fs::create_directories(dir / "vigil");
  setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
  return dir;
}

static void write_file(const fs::path& path, const std::string& content) {
  std::ofstream(path) << content;
}

TEST(config_defaults_without_file) {
  auto home = config_home("defaults");
  auto c = load_config();
  ASSERT_TRUE(c.has_value());
  ASSERT_EQ(c->paths.data_dir, "data");
  ASSERT_EQ(c->paths.roster, "users.csv");
  ASSERT_EQ(c->paths.log_file, "anomalies.log");
  ASSERT_EQ(c->inactivity.high_days, 180);
  ASSERT_EQ(c->inactivity.medium_days, 90);
  ASSERT_TRUE(!c->inactivity.disabled_recent_days.has_value());
  ASSERT_EQ(c->failed_login.high_count, 3);
  ASSERT_EQ(c->address.brute_force_count, 5);
  ASSERT_EQ(c->process_denylist.size(), 4u);
  ASSERT_EQ(c->service_denylist.size(), 3u);
  ASSERT_EQ(c->echo, true);
  fs::remove_all(home);
}

TEST(config_file_overrides_defaults) {
  auto home = config_home("file");
  write_file(home / "vigil" / "config.toml",
    "[paths]\n"
    "data_dir = \"/srv/audit\"\n"
    "log_file = \"/var/log/vigil.log\"\n"
    "[inactivity]\n"
    "policy = \"recent_login_guard\"\n"
    "recent_days = 14\n"
    "high_days = 120\n"
    "medium_days = 60\n"
    "[denylist]\n"
    "processes = [\"nc\", \"socat\"]\n"
    "[output]\n"
    "echo = false\n");
  auto c = load_config();
  ASSERT_TRUE(c.has_value());
  ASSERT_EQ(c->paths.data_dir, "/srv/audit");
  ASSERT_EQ(c->inactivity.high_days, 120);
  ASSERT_EQ(c->inactivity.medium_days, 60);
  ASSERT_EQ(c->inactivity.disabled_recent_days.value_or(0), 14);
  ASSERT_EQ(c->recent_days, 14);
  ASSERT_EQ(c->process_denylist.size(), 2u);
  ASSERT_EQ(c->process_denylist[1], "socat");
  ASSERT_EQ(c->echo, false);
  // relative paths resolve under data_dir, absolute ones stay put
  ASSERT_EQ(c->resolve(c->paths.roster), fs::path("/srv/audit/users.csv"));
  ASSERT_EQ(c->resolve(c->paths.log_file), fs::path("/var/log/vigil.log"));
  fs::remove_all(home);
}

TEST(config_env_fills_gaps) {
  auto home = config_home("env");
  write_file(home / "vigil" / "config.toml", "[inactivity]\nhigh_days = 200\n");
  setenv("VIGIL_HIGH_DAYS", "365", 1);
  setenv("VIGIL_MEDIUM_DAYS", "45", 1);
  setenv("vigil_service_denylist", "Telnet,SNMP", 1);
  auto c = load_config();
  unsetenv("VIGIL_HIGH_DAYS");
  unsetenv("VIGIL_MEDIUM_DAYS");
  unsetenv("vigil_service_denylist");
  ASSERT_TRUE(c.has_value());
  // TOML wins over the environment
  ASSERT_EQ(c->inactivity.high_days, 200);
  ASSERT_EQ(c->inactivity.medium_days, 45);
  ASSERT_EQ(c->service_denylist.size(), 2u);
  ASSERT_EQ(c->service_denylist[1], "SNMP");
  fs::remove_all(home);
}

TEST(config_rejects_bad_thresholds) {
  auto home = config_home("bad");
  write_file(home / "vigil" / "config.toml",
    "[inactivity]\nhigh_days = 30\nmedium_days = 60\npolicy = \"nonsense\"\n"
    "[failed_login]\nhigh_count = 0\n");
  auto c = load_config();
  ASSERT_TRUE(c.has_value());
  ASSERT_EQ(c->inactivity.high_days, 180);
  ASSERT_EQ(c->inactivity.medium_days, 90);
  ASSERT_EQ(std::string(c->inactivity.name()), "any_disabled");
  ASSERT_EQ(c->failed_login.high_count, 3);
  fs::remove_all(home);
}

TEST(config_explicit_path) {
  auto home = config_home("explicit");
  auto path = home / "custom.toml";
  write_file(path, "[auth_log]\nbrute_force_count = 10\n");
  auto c = load_config(path.string());
  ASSERT_TRUE(c.has_value());
  ASSERT_EQ(c->address.brute_force_count, 10);
  ASSERT_TRUE(!load_config((home / "missing.toml").string()).has_value());
  fs::remove_all(home);
}
