#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vigil::model {

enum class UserStatus { Active, Disabled };

struct UserRecord {
  std::string username;
  int last_login_days{};   // >= 0
  UserStatus status{UserStatus::Active};
};

struct EventRecord {
  std::string user;
  std::string event_type;  // e.g. "failed_login"
  std::string timestamp;   // opaque, empty when the feed has none
};

struct ProcessRecord {
  int32_t pid{};           // 0 when read from an inventory without pids
  std::string name;        // comm
};

struct ServiceRecord {
  std::string name;
  std::string status;      // as exported ("Running", "Stopped", ...), may be empty
};

// One entry read from a record source: either a parsed record or the reason
// the entry was rejected. `row` is the 1-based line (CSV) or element (JSON).
template <typename T>
struct SourceRow {
  size_t row{};
  std::optional<T> record;
  std::string error;

  [[nodiscard]] bool ok() const { return record.has_value(); }
};

template <typename T>
using SourceRows = std::vector<SourceRow<T>>;

inline const char* status_name(UserStatus s) {
  return s == UserStatus::Disabled ? "disabled" : "active";
}

} // namespace vigil::model
