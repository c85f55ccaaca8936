#pragma once

#include <string>
#include <unicode/unistr.h>

namespace lyre::util {

/// Case-insensitive string comparison using ICU full case folding
/// ("Ä" == "ä", "ẞ" == "ss").
/// Returns: <0 if a < b, 0 if a == b, >0 if a > b (like strcmp)
inline int case_insensitive_compare(const std::string& a, const std::string& b) {
    icu::UnicodeString ua = icu::UnicodeString::fromUTF8(a);
    icu::UnicodeString ub = icu::UnicodeString::fromUTF8(b);

    // Full folding (U_FOLD_CASE_DEFAULT) expands sharp s to "ss"
    ua.foldCase();
    ub.foldCase();

    return ua.compareCodePointOrder(ub);
}

} // namespace lyre::util
