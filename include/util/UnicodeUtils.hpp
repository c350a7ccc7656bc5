#pragma once

#include <string>
#include <string_view>

namespace tessera::util {

inline constexpr char32_t REPLACEMENT_CHARACTER = U'\uFFFD';

/// True for code points that may live in a cell: 0..0x10FFFF minus surrogates
bool is_scalar_value(char32_t cp);

/// C0 controls, DEL and C1 controls; these move the cursor or start escape
/// sequences, so they never reach the terminal as cell content
bool is_control(char32_t cp);

/// Terminal column width of a code point: 0 for combining marks and format
/// characters, 2 for East Asian Wide/Fullwidth and emoji presentation, 1 otherwise
int display_width(char32_t cp);

/// Append the UTF-8 encoding of `cp`. Returns false (and appends nothing)
/// when `cp` is not encodable.
bool append_utf8(std::string& out, char32_t cp);

/// Decode UTF-8 into code points; malformed sequences become U+FFFD
std::u32string decode_utf8(std::string_view text);

}  // namespace tessera::util
