#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace tempconv::core {

/// True when `text` is well-formed UTF-8
/// Rejects overlong forms, surrogates (U+D800..U+DFFF) and values above U+10FFFF.
bool isValidUtf8(const std::string& text);

/// True for code points with the Unicode White_Space property
bool isUnicodeWhitespace(uint32_t code_point);

/// Strip leading and trailing Unicode whitespace from UTF-8 text
/// Input must be valid UTF-8.
std::string trimWhitespace(const std::string& text);

} // namespace tempconv::core
