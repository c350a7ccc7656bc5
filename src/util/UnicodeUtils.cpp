#include "util/UnicodeUtils.hpp"
#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace tessera::util {

bool is_scalar_value(char32_t cp) {
    return cp <= 0x10FFFF && !U_IS_SURROGATE(cp);
}

bool is_control(char32_t cp) {
    return cp < 0x20 || (cp >= 0x7F && cp < 0xA0);
}

int display_width(char32_t cp) {
    if (cp < 0x80) return 1; // ASCII fast path
    if (!is_scalar_value(cp)) return 1;

    UChar32 c = static_cast<UChar32>(cp);

    int8_t category = u_charType(c);
    if (category == U_NON_SPACING_MARK || category == U_ENCLOSING_MARK ||
        category == U_FORMAT_CHAR) {
        return 0;
    }

    auto ea = static_cast<UEastAsianWidth>(u_getIntPropertyValue(c, UCHAR_EAST_ASIAN_WIDTH));
    if (ea == U_EA_WIDE || ea == U_EA_FULLWIDTH) return 2;

    if (u_hasBinaryProperty(c, UCHAR_EMOJI_PRESENTATION)) return 2;

    return 1;
}

bool append_utf8(std::string& out, char32_t cp) {
    if (!is_scalar_value(cp)) return false;

    uint8_t buf[U8_MAX_LENGTH];
    int32_t len = 0;
    UBool is_error = false;
    U8_APPEND(buf, len, U8_MAX_LENGTH, static_cast<UChar32>(cp), is_error);
    if (is_error) return false;

    out.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(len));
    return true;
}

std::u32string decode_utf8(std::string_view text) {
    std::u32string result;
    result.reserve(text.size());

    const auto* s = reinterpret_cast<const uint8_t*>(text.data());
    int32_t length = static_cast<int32_t>(text.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(s, i, length, c);
        result.push_back(c < 0 ? REPLACEMENT_CHARACTER : static_cast<char32_t>(c));
    }
    return result;
}

}  // namespace tessera::util
