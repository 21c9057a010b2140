#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace vigil::app {

enum class LogLevel { Info, Warning, Error };

[[nodiscard]] const char* level_name(LogLevel level);

// Append-only line log: "<YYYY-MM-DD HH:MM:SS> <LEVEL>: <message>".
// The file (and its parent directories) are created on the first append;
// existing content is never truncated. Every line is flushed before append()
// returns. Failures throw SinkError.
class LogSink {
public:
  explicit LogSink(std::filesystem::path path, bool echo = false);
  LogSink(const LogSink&) = delete;
  LogSink& operator=(const LogSink&) = delete;

  void append(LogLevel level, std::string_view message);

  void info(std::string_view message)    { append(LogLevel::Info, message); }
  void warning(std::string_view message) { append(LogLevel::Warning, message); }
  void error(std::string_view message)   { append(LogLevel::Error, message); }

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }
  [[nodiscard]] size_t lines_written() const { return lines_written_; }

private:
  void open();
  [[nodiscard]] static std::string timestamp_now();

  std::filesystem::path path_;
  bool echo_;
  std::ofstream file_;
  size_t lines_written_{0};
};

} // namespace vigil::app
