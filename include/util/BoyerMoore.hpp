#pragma once

#include <string>
#include <string_view>

namespace sysmaint::util {

// Boyer-Moore-Horspool literal search, case-sensitive.
// O(1) extra space (fixed 256-entry bad character table).
// Average case: O(n/m) sublinear. Worst case: O(n*m).
class BoyerMooreSearch {
public:
    explicit BoyerMooreSearch(std::string pattern);

    // Returns position of first match, or -1 if not found.
    [[nodiscard]] long search(std::string_view text) const;

    [[nodiscard]] bool found_in(std::string_view text) const { return search(text) >= 0; }

private:
    static constexpr int ALPHABET_SIZE = 256;

    long bad_char_[ALPHABET_SIZE];
    std::string pattern_;

    void compute_bad_char();
};

} // namespace sysmaint::util
