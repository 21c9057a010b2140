#pragma once

#include <string>
#include <string_view>
#include "util/AsciiLower.hpp"

namespace vigil::util {

// Boyer-Moore-Horspool literal search, case-insensitive over ASCII.
// O(1) extra space (fixed 256-entry bad character table).
// Used to spot log keywords ("failed", "error", ...) without a regex per line.
class BoyerMooreSearch {
public:
    explicit BoyerMooreSearch(std::string_view pattern);

    // Returns position of first match, or -1 if not found.
    [[nodiscard]] int search(std::string_view text) const;

    [[nodiscard]] bool contains(std::string_view text) const { return search(text) >= 0; }

    [[nodiscard]] const std::string& pattern() const { return pattern_; }

private:
    static constexpr int ALPHABET_SIZE = 256;

    int bad_char_[ALPHABET_SIZE];
    std::string pattern_;
    int pattern_len_;

    void compute_bad_char();
};

} // namespace vigil::util
