#include "app/LogScanner.hpp"

#include <algorithm>
#include <numeric>

namespace vigil::app {

std::vector<std::pair<std::string, int>> LogScanSummary::ranked_addresses() const {
  std::vector<std::pair<std::string, int>> out(address_failures.begin(), address_failures.end());
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b){ return a.second > b.second; });
  return out;
}

LogScanner::LogScanner()
  : failed_("failed"), error_("error"), unauthorized_("unauthorized") {}

static bool valid_octets(const std::string& quad) {
  size_t start = 0;
  while (start <= quad.size()) {
    size_t end = quad.find('.', start);
    if (end == std::string::npos) end = quad.size();
    if (std::stoi(quad.substr(start, end - start)) > 255) return false;
    start = end + 1;
  }
  return true;
}

std::optional<std::string> first_ipv4(std::string_view line) {
  static const std::regex rx(R"((^|[^0-9.])(\d{1,3}(?:\.\d{1,3}){3})(?![0-9]))");
  std::string s(line);
  for (auto it = std::sregex_iterator(s.begin(), s.end(), rx); it != std::sregex_iterator(); ++it) {
    std::string quad = (*it)[2].str();
    if (valid_octets(quad)) return quad;
  }
  return std::nullopt;
}

LogScanSummary LogScanner::fold(LogScanSummary acc, std::string_view line) const {
  ++acc.lines;
  const bool failed = failed_.contains(line);
  if (failed) ++acc.failed;
  if (error_.contains(line)) ++acc.error;
  if (unauthorized_.contains(line)) ++acc.unauthorized;
  if (failed) {
    if (auto ip = first_ipv4(line)) ++acc.address_failures[*ip];
  }
  return acc;
}

LogScanSummary LogScanner::scan(const std::vector<std::string>& lines) const {
  return std::accumulate(lines.begin(), lines.end(), LogScanSummary{},
                         [this](LogScanSummary acc, const std::string& line){ return fold(std::move(acc), line); });
}

} // namespace vigil::app
