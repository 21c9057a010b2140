#include "minitest.hpp"
#include "app/Denylist.hpp"
#include <string>

using vigil::app::CaseMode;
using vigil::app::Denylist;

TEST(process_denylist_ignores_case) {
  auto d = Denylist::for_processes({"nc"});
  ASSERT_EQ(d.mode(), CaseMode::Insensitive);
  ASSERT_TRUE(d.match("nc"));
  ASSERT_TRUE(d.match("NC"));
  ASSERT_TRUE(d.match("Nc"));
}

TEST(service_denylist_is_case_sensitive) {
  auto d = Denylist::for_services({"Telnet"});
  ASSERT_EQ(d.mode(), CaseMode::Sensitive);
  ASSERT_TRUE(d.match("Telnet"));
  ASSERT_TRUE(!d.match("telnet"));
  ASSERT_TRUE(!d.match("TELNET"));
}

TEST(denylist_is_exact_name_only) {
  auto d = Denylist::for_processes({"nc", "john"});
  ASSERT_TRUE(!d.match("ncat"));
  ASSERT_TRUE(!d.match("sync"));
  ASSERT_TRUE(!d.match("johnny"));
  ASSERT_TRUE(!d.match(" nc"));
  ASSERT_TRUE(!d.match(""));
}

TEST(empty_denylist_matches_nothing) {
  auto d = Denylist::for_processes({});
  ASSERT_TRUE(d.empty());
  ASSERT_TRUE(!d.match("nc"));
  ASSERT_TRUE(!d.match(""));
}

TEST(default_denylists) {
  auto procs = Denylist::for_processes(vigil::app::default_process_denylist());
  for (const char* n : {"nc", "netcat", "hydra", "john", "HYDRA"}) ASSERT_TRUE(procs.match(n));
  ASSERT_TRUE(!procs.match("bash"));
  ASSERT_EQ(procs.joined(), "nc, netcat, hydra, john");

  auto svcs = Denylist::for_services(vigil::app::default_service_denylist());
  for (const char* n : {"Telnet", "RemoteRegistry", "Spooler"}) ASSERT_TRUE(svcs.match(n));
  ASSERT_TRUE(!svcs.match("spooler"));
  ASSERT_EQ(svcs.joined("|"), "Telnet|RemoteRegistry|Spooler");
}
