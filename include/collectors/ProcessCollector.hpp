#pragma once
#include "collectors/IProcessCollector.hpp"
#include <optional>
#include <string>

namespace vigil::collectors {

// Traditional /proc scanner: one ProcessRecord per numeric /proc entry,
// named by /proc/<pid>/comm (falling back to the comm field of /proc/<pid>/stat).
class ProcessCollector : public IProcessCollector {
public:
  ProcessCollector() = default;
  bool init() override;
  const char* name() const override { return "/proc scanner"; }
  std::vector<model::ProcessRecord> list_processes() override;

private:
  static std::optional<std::string> read_comm(int32_t pid);
  static bool parse_stat_comm(const std::string& content, std::string& comm);
};

} // namespace vigil::collectors
