#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unicode/unistr.h>
#include <unicode/uchar.h>
#include <unicode/utf16.h>

namespace tether::util {

/// Strip leading and trailing Unicode White_Space (ASCII blanks, NBSP,
/// ideographic space, line/paragraph separators...) from a UTF-8 string.
inline std::string trim_whitespace(const std::string& text) {
    if (text.empty()) {
        return text;
    }

    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);

    int32_t start = 0;
    int32_t end = unicode_text.length();
    while (start < end) {
        UChar32 c = unicode_text.char32At(start);
        if (!u_isUWhiteSpace(c)) break;
        start += U16_LENGTH(c);
    }
    while (end > start) {
        // char32At on a trail surrogate yields the whole supplementary code point
        UChar32 c = unicode_text.char32At(end - 1);
        if (!u_isUWhiteSpace(c)) break;
        end -= U16_LENGTH(c);
    }

    std::string result;
    unicode_text.tempSubStringBetween(start, end).toUTF8String(result);
    return result;
}

/// Bound a UTF-8 string to max_units UTF-16 code units, the way a fixed
/// wide-char title buffer would. Never splits a surrogate pair.
inline std::string truncate_utf16(const std::string& text, std::size_t max_units) {
    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);
    if (static_cast<std::size_t>(unicode_text.length()) <= max_units) {
        return text;
    }

    int32_t length = static_cast<int32_t>(max_units);
    if (length > 0 && U16_IS_LEAD(unicode_text.charAt(length - 1))) {
        --length;
    }
    unicode_text.truncate(length);

    std::string result;
    unicode_text.toUTF8String(result);
    return result;
}

/// Decode ISO-8859-1 bytes (the ICCCM STRING encoding) to UTF-8
inline std::string latin1_to_utf8(const std::string& bytes) {
    icu::UnicodeString unicode_text(bytes.data(), static_cast<int32_t>(bytes.size()), "ISO-8859-1");

    std::string result;
    unicode_text.toUTF8String(result);
    return result;
}

/// Length in UTF-16 code units
inline std::size_t utf16_length(const std::string& text) {
    return static_cast<std::size_t>(icu::UnicodeString::fromUTF8(text).length());
}

}  // namespace tether::util
