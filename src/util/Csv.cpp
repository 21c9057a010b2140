#include "util/Csv.hpp"

#include <cctype>

namespace vigil::util {

std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
  return sv;
}

std::optional<std::vector<std::string>> split_csv_line(std::string_view line) {
  std::vector<std::string> fields;
  std::string cur;
  bool in_quotes = false;
  bool was_quoted = false;

  auto flush = [&]{
    // Quoted fields keep inner whitespace; bare fields are trimmed
    if (was_quoted) fields.push_back(cur);
    else fields.emplace_back(trim(cur));
    cur.clear();
    was_quoted = false;
  };

  for (size_t i = 0; i < line.size(); ++i) {
    char c = line[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') { cur.push_back('"'); ++i; }
        else in_quotes = false;
      } else {
        cur.push_back(c);
      }
      continue;
    }
    if (c == '"' && !was_quoted && trim(cur).empty()) {
      cur.clear();
      in_quotes = true;
      was_quoted = true;
    } else if (c == ',') {
      flush();
    } else if (c == '\r' || c == '\n') {
      // stray line terminators from CRLF files
    } else if (was_quoted) {
      // only whitespace may follow a closing quote
      if (!std::isspace(static_cast<unsigned char>(c))) return std::nullopt;
    } else {
      cur.push_back(c);
    }
  }
  if (in_quotes) return std::nullopt;  // unterminated quoted field
  flush();
  return fields;
}

std::vector<std::string> split_list(std::string_view s, char sep) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= s.size()) {
    size_t end = s.find(sep, start);
    if (end == std::string_view::npos) end = s.size();
    auto item = trim(s.substr(start, end - start));
    if (!item.empty()) out.emplace_back(item);
    start = end + 1;
  }
  return out;
}

} // namespace vigil::util
