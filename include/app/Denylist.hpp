#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace vigil::app {

enum class CaseMode { Sensitive, Insensitive };

// Exact-name membership test against an injected set of risky names.
// No substring or prefix matching.
class Denylist {
public:
  Denylist(std::vector<std::string> names, CaseMode mode);

  // Process names: casing differs across platforms, so compare case-insensitively.
  [[nodiscard]] static Denylist for_processes(std::vector<std::string> names);
  // Service names are canonical identifiers: compare exactly.
  [[nodiscard]] static Denylist for_services(std::vector<std::string> names);

  [[nodiscard]] bool match(std::string_view name) const;

  [[nodiscard]] CaseMode mode() const { return mode_; }
  [[nodiscard]] bool empty() const { return keys_.empty(); }
  // Names as configured, for messages ("nc, netcat, hydra, john")
  [[nodiscard]] std::string joined(std::string_view sep = ", ") const;

private:
  CaseMode mode_;
  std::vector<std::string> names_;
  std::unordered_set<std::string> keys_;

  [[nodiscard]] std::string key(std::string_view name) const;
};

[[nodiscard]] const std::vector<std::string>& default_process_denylist();
[[nodiscard]] const std::vector<std::string>& default_service_denylist();

} // namespace vigil::app
