// Helpers for reading /proc with an optional root remap (VIGIL_PROC_ROOT)
#pragma once
#include <optional>
#include <string>
#include <vector>

namespace vigil::util {

// Map an absolute /proc path to an alternate root if VIGIL_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// List directory entries (names only). Returns std::nullopt if the directory
// cannot be opened, so callers can tell "empty" from "unreadable".
auto list_dir(const std::string& abs) -> std::optional<std::vector<std::string>>;

// True if s is a non-empty run of ASCII digits (a /proc pid entry).
[[nodiscard]] bool is_pid_name(const std::string& s);

} // namespace vigil::util
