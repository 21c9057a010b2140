#include "minitest.hpp"
#include "util/AsciiLower.hpp"
#include "util/BoyerMoore.hpp"
#include "util/Csv.hpp"
#include "util/Utf8.hpp"
#include <string>
#include <vector>

using namespace vigil::util;

TEST(bm_finds_case_insensitive) {
  BoyerMooreSearch bm("failed");
  ASSERT_EQ(bm.search("Failed password for root"), 0);
  ASSERT_EQ(bm.search("sshd: FAILED"), 6);
  ASSERT_TRUE(bm.contains("authentication failed from 10.0.0.1"));
  ASSERT_TRUE(!bm.contains("accepted publickey"));
  ASSERT_TRUE(!bm.contains("fail"));
  ASSERT_EQ(bm.pattern(), "failed");
}

TEST(bm_pattern_longer_than_text) {
  BoyerMooreSearch bm("unauthorized");
  ASSERT_EQ(bm.search("unauth"), -1);
  ASSERT_EQ(bm.search(""), -1);
}

TEST(bm_long_pattern_searched_whole) {
  std::string pattern(300, 'a');
  pattern += "failed";
  BoyerMooreSearch bm(pattern);
  ASSERT_EQ(bm.pattern().size(), pattern.size());
  ASSERT_EQ(bm.search("x" + std::string(300, 'A') + "FAILED"), 1);
  ASSERT_EQ(bm.search(std::string(300, 'a') + "faile"), -1);
}

TEST(ascii_lower_helpers) {
  ASSERT_EQ(ascii_lower_copy("ReMoteREGISTRY"), "remoteregistry");
  ASSERT_TRUE(ascii_iequals("Active", "ACTIVE"));
  ASSERT_TRUE(!ascii_iequals("Active", "Activ"));
}

TEST(csv_plain_fields_trimmed) {
  auto r = split_csv_line(" alice , 200 ,disabled");
  ASSERT_TRUE(r.has_value());
  const auto& f = *r;
  ASSERT_EQ(f.size(), 3u);
  ASSERT_EQ(f[0], "alice");
  ASSERT_EQ(f[1], "200");
  ASSERT_EQ(f[2], "disabled");
}

TEST(csv_quoted_fields) {
  auto r = split_csv_line(R"("Spooler","Print ""Spooler"", queue" ,"Running")");
  ASSERT_TRUE(r.has_value());
  const auto& f = *r;
  ASSERT_EQ(f.size(), 3u);
  ASSERT_EQ(f[0], "Spooler");
  ASSERT_EQ(f[1], "Print \"Spooler\", queue");
  ASSERT_EQ(f[2], "Running");
}

TEST(csv_empty_fields_and_cr) {
  auto r = split_csv_line("a,,c\r");
  ASSERT_TRUE(r.has_value());
  const auto& f = *r;
  ASSERT_EQ(f.size(), 3u);
  ASSERT_EQ(f[1], "");
  ASSERT_EQ(f[2], "c");
}

TEST(csv_broken_quoting_rejected) {
  ASSERT_TRUE(!split_csv_line(R"("alice"x,200,disabled)").has_value());
  ASSERT_TRUE(!split_csv_line(R"(alice,"200" 1,active)").has_value());
  ASSERT_TRUE(!split_csv_line(R"("unterminated,200,active)").has_value());
  // a quote inside a bare field is literal
  auto r = split_csv_line(R"(o"brien,5,active)");
  ASSERT_TRUE(r.has_value());
  ASSERT_EQ((*r)[0], "o\"brien");
}

TEST(split_list_drops_empty_items) {
  auto v = split_list(" nc, ,hydra,,john ");
  ASSERT_EQ(v.size(), 3u);
  ASSERT_EQ(v[0], "nc");
  ASSERT_EQ(v[2], "john");
  ASSERT_TRUE(split_list("").empty());
}

TEST(utf8_validation) {
  ASSERT_TRUE(is_valid_utf8("plain ascii"));
  ASSERT_TRUE(is_valid_utf8("caf\xC3\xA9"));
  ASSERT_TRUE(is_valid_utf8("\xF0\x9F\x94\x92"));
  ASSERT_TRUE(!is_valid_utf8("bad \xFF byte"));
  ASSERT_TRUE(!is_valid_utf8("\xC0\xAF"));          // overlong '/'
  ASSERT_TRUE(!is_valid_utf8("\xED\xA0\x80"));      // surrogate
  ASSERT_TRUE(!is_valid_utf8("trunc \xE2\x82"));
}

TEST(utf8_strip_bom) {
  ASSERT_EQ(std::string(strip_bom("\xEF\xBB\xBFusername")), "username");
  ASSERT_EQ(std::string(strip_bom("username")), "username");
}
