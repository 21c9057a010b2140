#pragma once
#include "model/Records.hpp"
#include <vector>

namespace vigil::collectors {

// Minimal interface for process enumeration so scans can run against the
// live /proc tree or a substitute (tests, recorded inventories).
class IProcessCollector {
public:
  virtual ~IProcessCollector() = default;

  // Initialize collector. Return false if unavailable (permissions, platform).
  [[nodiscard]] virtual bool init() { return true; }

  // Enumerate running processes in pid order. Throws app::CollectorError when
  // the process table itself cannot be read.
  [[nodiscard]] virtual std::vector<model::ProcessRecord> list_processes() = 0;

  // Human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace vigil::collectors
