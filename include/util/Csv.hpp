#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::util {

// Split one CSV record into fields. Handles double-quoted fields with
// embedded commas and "" escapes (PowerShell Export-Csv quotes everything).
// Fields are returned unquoted and trimmed of surrounding whitespace.
// Returns std::nullopt for broken quoting: an unterminated quoted field or
// text after a closing quote ("alice"x).
[[nodiscard]] std::optional<std::vector<std::string>> split_csv_line(std::string_view line);

[[nodiscard]] std::string_view trim(std::string_view sv);

// Split a comma-separated list, dropping empty items.
[[nodiscard]] std::vector<std::string> split_list(std::string_view s, char sep = ',');

} // namespace vigil::util
