#pragma once

#include "util/BoyerMoore.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vigil::app {

// Result of one pass over a log. Counts are per line: a line mentioning
// "failed" twice counts once.
struct LogScanSummary {
  size_t lines{};
  size_t failed{};
  size_t error{};
  size_t unauthorized{};
  std::map<std::string, int> address_failures;  // IPv4 -> lines with "failed"

  [[nodiscard]] size_t indicators() const { return failed + error + unauthorized; }

  // Addresses ordered by failure count (desc), then address.
  [[nodiscard]] std::vector<std::pair<std::string, int>> ranked_addresses() const;
};

class LogScanner {
public:
  LogScanner();

  // Fold one line into acc.
  [[nodiscard]] LogScanSummary fold(LogScanSummary acc, std::string_view line) const;

  [[nodiscard]] LogScanSummary scan(const std::vector<std::string>& lines) const;

private:
  util::BoyerMooreSearch failed_;
  util::BoyerMooreSearch error_;
  util::BoyerMooreSearch unauthorized_;
};

// First dotted-quad in line whose octets are all <= 255.
[[nodiscard]] std::optional<std::string> first_ipv4(std::string_view line);

} // namespace vigil::app
