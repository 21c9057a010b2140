#include "minitest.hpp"
#include "app/Errors.hpp"
#include "app/LogSink.hpp"
#include <filesystem>
#include <fstream>
#include <regex>
#include <string>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;
using vigil::app::LogSink;

static fs::path test_dir(const char* suffix) {
  auto dir = fs::temp_directory_path() /
             ("vigil_sink_test_" + std::to_string(::getpid()) + "_" + suffix);
  fs::remove_all(dir);
  return dir;
}

static std::vector<std::string> read_lines(const fs::path& p) {
  std::vector<std::string> out;
  std::ifstream in(p);
  std::string line;
  while (std::getline(in, line)) out.push_back(line);
  return out;
}

TEST(sink_creates_parent_directories_lazily) {
  auto dir = test_dir("mkdir");
  auto path = dir / "nested" / "anomalies.log";
  LogSink sink(path);
  ASSERT_TRUE(!fs::exists(dir));
  sink.info("hello");
  ASSERT_TRUE(fs::is_regular_file(path));
  ASSERT_EQ(sink.lines_written(), 1u);
  fs::remove_all(dir);
}

TEST(sink_line_format) {
  auto dir = test_dir("format");
  auto path = dir / "anomalies.log";
  {
    LogSink sink(path);
    sink.info("scan started");
    sink.warning("alice: CRITICAL [inactive > 180 days & disabled]");
    sink.error("scan aborted: x");
  }
  auto lines = read_lines(path);
  ASSERT_EQ(lines.size(), 3u);
  const std::regex rx(R"(^\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} (INFO|WARNING|ERROR): .*$)");
  for (const auto& l : lines) ASSERT_TRUE(std::regex_match(l, rx));
  ASSERT_TRUE(lines[0].find(" INFO: scan started") != std::string::npos);
  ASSERT_TRUE(lines[1].find(" WARNING: alice: CRITICAL") != std::string::npos);
  ASSERT_TRUE(lines[2].find(" ERROR: scan aborted: x") != std::string::npos);
  fs::remove_all(dir);
}

TEST(sink_appends_without_truncating) {
  auto dir = test_dir("append");
  fs::create_directories(dir);
  auto path = dir / "anomalies.log";
  std::ofstream(path) << "previous run line\n";
  {
    LogSink sink(path);
    sink.info("first");
  }
  {
    LogSink sink(path);
    sink.info("second");
  }
  auto lines = read_lines(path);
  ASSERT_EQ(lines.size(), 3u);
  ASSERT_EQ(lines[0], "previous run line");
  ASSERT_TRUE(lines[1].find("first") != std::string::npos);
  ASSERT_TRUE(lines[2].find("second") != std::string::npos);
  fs::remove_all(dir);
}

TEST(sink_lines_visible_before_destruction) {
  auto dir = test_dir("flush");
  auto path = dir / "anomalies.log";
  LogSink sink(path);
  sink.warning("flushed");
  ASSERT_EQ(read_lines(path).size(), 1u);
  fs::remove_all(dir);
}

TEST(sink_unwritable_destination_throws) {
  auto dir = test_dir("blocked");
  fs::create_directories(dir);
  // a regular file where a directory is needed
  std::ofstream(dir / "file") << "x";
  LogSink sink(dir / "file" / "anomalies.log");
  ASSERT_THROWS(sink.info("never written"), vigil::app::SinkError);
  ASSERT_EQ(sink.lines_written(), 0u);
  fs::remove_all(dir);
}
