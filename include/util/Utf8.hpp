#pragma once

#include <string_view>

namespace vigil::util {

// Strict UTF-8 validation: rejects overlong encodings, surrogates and
// code points above U+10FFFF.
[[nodiscard]] bool is_valid_utf8(std::string_view s);

// Drop a leading UTF-8 byte order mark (Windows exports often carry one).
[[nodiscard]] std::string_view strip_bom(std::string_view s);

} // namespace vigil::util
