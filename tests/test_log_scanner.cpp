#include "minitest.hpp"
#include "app/LogScanner.hpp"
#include <string>
#include <vector>

using vigil::app::LogScanner;
using vigil::app::first_ipv4;

TEST(scanner_counts_keywords_per_line) {
  std::vector<std::string> lines = {
    "Jan 1 sshd[1]: Failed password for root from 10.0.0.5 port 22",
    "Jan 1 sshd[1]: failed password for admin from 10.0.0.5 port 22 (failed twice)",
    "Jan 1 app: ERROR could not open socket",
    "Jan 1 web: Unauthorized access to /admin",
    "Jan 1 sshd[1]: Accepted publickey for bob",
  };
  const LogScanner scanner;
  auto s = scanner.scan(lines);
  ASSERT_EQ(s.lines, 5u);
  ASSERT_EQ(s.failed, 2u);
  ASSERT_EQ(s.error, 1u);
  ASSERT_EQ(s.unauthorized, 1u);
  ASSERT_EQ(s.indicators(), 4u);
  ASSERT_EQ(s.address_failures.size(), 1u);
  ASSERT_EQ(s.address_failures.at("10.0.0.5"), 2);
}

TEST(scanner_addresses_only_on_failed_lines) {
  const LogScanner scanner;
  auto s = scanner.scan({"Accepted password from 192.168.1.9", "error from 192.168.1.9"});
  ASSERT_TRUE(s.address_failures.empty());
  ASSERT_EQ(s.failed, 0u);
}

TEST(scanner_empty_input) {
  const LogScanner scanner;
  auto s = scanner.scan({});
  ASSERT_EQ(s.lines, 0u);
  ASSERT_EQ(s.indicators(), 0u);
  ASSERT_TRUE(s.ranked_addresses().empty());
}

TEST(scanner_fold_is_incremental) {
  const LogScanner scanner;
  auto a = scanner.fold({}, "Failed login from 1.2.3.4");
  auto b = scanner.fold(a, "FAILED login from 1.2.3.4");
  ASSERT_EQ(a.failed, 1u);
  ASSERT_EQ(b.failed, 2u);
  ASSERT_EQ(b.address_failures.at("1.2.3.4"), 2);
}

TEST(ranked_addresses_by_count_then_address) {
  vigil::app::LogScanSummary s;
  s.address_failures = {{"10.0.0.2", 1}, {"10.0.0.1", 7}, {"10.0.0.3", 7}, {"10.0.0.4", 2}};
  auto r = s.ranked_addresses();
  ASSERT_EQ(r.size(), 4u);
  ASSERT_EQ(r[0].first, "10.0.0.1");
  ASSERT_EQ(r[1].first, "10.0.0.3");
  ASSERT_EQ(r[2].first, "10.0.0.4");
  ASSERT_EQ(r[3].first, "10.0.0.2");
}

TEST(first_ipv4_extraction) {
  ASSERT_EQ(first_ipv4("from 10.1.2.3 port 22").value_or(""), "10.1.2.3");
  ASSERT_EQ(first_ipv4("10.1.2.3").value_or(""), "10.1.2.3");
  ASSERT_EQ(first_ipv4("rhost=999.1.1.1 then 8.8.8.8").value_or(""), "8.8.8.8");
  ASSERT_TRUE(!first_ipv4("version 1.2.3 only").has_value());
  ASSERT_TRUE(!first_ipv4("1234.1.1.1").has_value());
  ASSERT_TRUE(!first_ipv4("").has_value());
}
