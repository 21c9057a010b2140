#include "util/BoyerMoore.hpp"

namespace vigil::util {

BoyerMooreSearch::BoyerMooreSearch(std::string_view pattern)
    : pattern_(ascii_lower_copy(pattern)),
      pattern_len_(static_cast<int>(pattern.size())) {
    compute_bad_char();
}

void BoyerMooreSearch::compute_bad_char() {
    for (int i = 0; i < ALPHABET_SIZE; ++i) {
        bad_char_[i] = pattern_len_;
    }
    // Pattern is stored lowercased; only the last char keeps the full shift
    for (int i = 0; i < pattern_len_ - 1; ++i) {
        bad_char_[static_cast<unsigned char>(pattern_[i])] = pattern_len_ - 1 - i;
    }
}

int BoyerMooreSearch::search(std::string_view text) const {
    const int n = static_cast<int>(text.size());
    const int m = pattern_len_;

    if (m == 0) return 0;
    if (m > n) return -1;

    int i = 0;
    while (i <= n - m) {
        int j = m - 1;
        while (j >= 0 &&
               ascii_lower(static_cast<unsigned char>(text[i + j])) ==
               static_cast<unsigned char>(pattern_[j])) {
            --j;
        }

        if (j < 0) return i;

        unsigned char bad = ascii_lower(static_cast<unsigned char>(text[i + m - 1]));
        int shift = bad_char_[bad];
        i += (shift > 0) ? shift : 1;
    }

    return -1;
}

} // namespace vigil::util
