#include "util/BoyerMoore.hpp"

#include <utility>

namespace sysmaint::util {

BoyerMooreSearch::BoyerMooreSearch(std::string pattern)
    : pattern_(std::move(pattern)) {
    compute_bad_char();
}

void BoyerMooreSearch::compute_bad_char() {
    const long m = static_cast<long>(pattern_.size());
    // All characters default to maximum shift (pattern length)
    for (int i = 0; i < ALPHABET_SIZE; ++i) {
        bad_char_[i] = m;
    }
    // Characters in pattern (except last) get actual shift distances
    for (long i = 0; i < m - 1; ++i) {
        unsigned char c = static_cast<unsigned char>(pattern_[i]);
        bad_char_[c] = m - 1 - i;
    }
}

long BoyerMooreSearch::search(std::string_view text) const {
    const long n = static_cast<long>(text.size());
    const long m = static_cast<long>(pattern_.size());

    if (m == 0) return 0; // empty pattern matches at position 0
    if (m > n) return -1;

    long i = 0;
    while (i <= n - m) {
        long j = m - 1;

        // Compare right to left
        while (j >= 0 && text[i + j] == pattern_[j]) {
            --j;
        }

        if (j < 0) return i; // match

        // Bad character shift
        unsigned char bad = static_cast<unsigned char>(text[i + m - 1]);
        long shift = bad_char_[bad];
        i += (shift > 0) ? shift : 1;
    }

    return -1;
}

} // namespace sysmaint::util
