#include "app/LogSink.hpp"
#include "app/Errors.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace vigil::app {

const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error:   return "ERROR";
  }
  return "INFO";
}

LogSink::LogSink(std::filesystem::path path, bool echo)
    : path_(std::move(path)), echo_(echo) {}

void LogSink::open() {
  if (path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw SinkError("cannot create " + path_.parent_path().string() + ": " + ec.message());
    }
  }
  file_.open(path_, std::ios::out | std::ios::app);
  if (!file_) {
    throw SinkError("cannot open " + path_.string() + ": " + std::strerror(errno));
  }
}

void LogSink::append(LogLevel level, std::string_view message) {
  if (!file_.is_open()) open();

  std::string line = timestamp_now();
  line += ' ';
  line += level_name(level);
  line += ": ";
  line += message;
  line += '\n';

  file_.write(line.data(), static_cast<std::streamsize>(line.size()));
  file_.flush();
  if (!file_) {
    throw SinkError("write failed for " + path_.string());
  }
  ++lines_written_;

  if (echo_) {
    // Best-effort mirror; the file is the record of the run
    if (std::fwrite(line.data(), 1, line.size(), stdout) != line.size()) { /* ignore */ }
  }
}

std::string LogSink::timestamp_now() {
  auto now_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  ::localtime_r(&now_t, &tm);

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec);
  return buf;
}

} // namespace vigil::app
