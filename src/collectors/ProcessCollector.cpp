#include "collectors/ProcessCollector.hpp"
#include "app/Errors.hpp"
#include "util/Procfs.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>

namespace vigil::collectors {

bool ProcessCollector::init() {
  if (util::list_dir("/proc")) return true;
  // /proc not mounted, or VIGIL_PROC_ROOT points somewhere without one
  std::fprintf(stderr, "vigil: ProcessCollector: %s is not readable\n",
               util::map_proc_path("/proc").c_str());
  return false;
}

bool ProcessCollector::parse_stat_comm(const std::string& content, std::string& comm) {
  // comm may itself contain parentheses; take the outermost pair
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp) return false;
  comm = content.substr(lp + 1, rp - lp - 1);
  return !comm.empty();
}

std::optional<std::string> ProcessCollector::read_comm(int32_t pid) {
  const std::string base = std::string("/proc/") + std::to_string(pid);
  if (auto txt = util::read_file_string(base + "/comm")) {
    std::string comm = *txt;
    while (!comm.empty() && (comm.back() == '\n' || comm.back() == '\r')) comm.pop_back();
    if (!comm.empty()) return comm;
  }
  if (auto stat = util::read_file_string(base + "/stat")) {
    std::string comm;
    if (parse_stat_comm(*stat, comm)) return comm;
  }
  return std::nullopt;
}

std::vector<model::ProcessRecord> ProcessCollector::list_processes() {
  auto entries = util::list_dir("/proc");
  if (!entries) {
    throw app::CollectorError("cannot list " + util::map_proc_path("/proc"));
  }

  std::vector<model::ProcessRecord> out;
  out.reserve(entries->size());
  for (const auto& e : *entries) {
    if (!util::is_pid_name(e)) continue;
    int32_t pid = 0;
    auto [ptr, ec] = std::from_chars(e.data(), e.data() + e.size(), pid);
    if (ec != std::errc{}) continue;
    // Processes that exit mid-scan simply drop out
    auto comm = read_comm(pid);
    if (!comm) continue;
    out.push_back(model::ProcessRecord{pid, std::move(*comm)});
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b){ return a.pid < b.pid; });
  return out;
}

} // namespace vigil::collectors
