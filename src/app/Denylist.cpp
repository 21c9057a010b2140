#include "app/Denylist.hpp"
#include "util/AsciiLower.hpp"

namespace vigil::app {

Denylist::Denylist(std::vector<std::string> names, CaseMode mode)
  : mode_(mode), names_(std::move(names)) {
  for (const auto& n : names_) keys_.insert(key(n));
}

Denylist Denylist::for_processes(std::vector<std::string> names) {
  return Denylist(std::move(names), CaseMode::Insensitive);
}

Denylist Denylist::for_services(std::vector<std::string> names) {
  return Denylist(std::move(names), CaseMode::Sensitive);
}

std::string Denylist::key(std::string_view name) const {
  if (mode_ == CaseMode::Insensitive) return util::ascii_lower_copy(name);
  return std::string(name);
}

bool Denylist::match(std::string_view name) const {
  if (name.empty()) return false;
  return keys_.count(key(name)) != 0;
}

std::string Denylist::joined(std::string_view sep) const {
  std::string out;
  for (size_t i = 0; i < names_.size(); ++i) {
    if (i) out += sep;
    out += names_[i];
  }
  return out;
}

const std::vector<std::string>& default_process_denylist() {
  static const std::vector<std::string> names = {"nc", "netcat", "hydra", "john"};
  return names;
}

const std::vector<std::string>& default_service_denylist() {
  static const std::vector<std::string> names = {"Telnet", "RemoteRegistry", "Spooler"};
  return names;
}

} // namespace vigil::app
