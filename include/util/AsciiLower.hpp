#pragma once

#include <array>
#include <string>
#include <string_view>

namespace vigil::util {

// Compile-time ASCII lowercase table. Bytes outside A-Z (including UTF-8
// continuation bytes) map to themselves.
inline constexpr std::array<unsigned char, 256> kAsciiLower = []{
  std::array<unsigned char, 256> t{};
  for (int i = 0; i < 256; ++i) {
    t[i] = (i >= 'A' && i <= 'Z') ? static_cast<unsigned char>(i + ('a' - 'A'))
                                  : static_cast<unsigned char>(i);
  }
  return t;
}();

[[nodiscard]] constexpr unsigned char ascii_lower(unsigned char c) { return kAsciiLower[c]; }

[[nodiscard]] inline std::string ascii_lower_copy(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(ascii_lower(static_cast<unsigned char>(c)));
  return out;
}

[[nodiscard]] inline bool ascii_iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (ascii_lower(static_cast<unsigned char>(a[i])) != ascii_lower(static_cast<unsigned char>(b[i])))
      return false;
  }
  return true;
}

} // namespace vigil::util
