#include "core/Utf8.hpp"

namespace tempconv::core {

namespace {

// Decode the sequence starting at text[pos]
// @return byte length (0 if malformed), code point in `cp`
size_t decodeAt(const std::string& text, size_t pos, uint32_t& cp) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(text[i]); };
    unsigned char lead = byte(pos);

    size_t length = 0;
    uint32_t min = 0;
    if (lead < 0x80) {
        cp = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2; min = 0x80; cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3; min = 0x800; cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4; min = 0x10000; cp = lead & 0x07;
    } else {
        return 0;
    }

    if (pos + length > text.size()) {
        return 0;
    }
    for (size_t i = 1; i < length; i++) {
        unsigned char next = byte(pos + i);
        if ((next & 0xC0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (next & 0x3F);
    }

    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return 0;
    }
    return length;
}

// Start of the code point that ends right before `end`
size_t previousStart(const std::string& text, size_t end) {
    size_t pos = end - 1;
    while (pos > 0 && (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) {
        pos--;
    }
    return pos;
}

} // namespace

bool isValidUtf8(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size()) {
        uint32_t cp;
        size_t length = decodeAt(text, pos, cp);
        if (length == 0) {
            return false;
        }
        pos += length;
    }
    return true;
}

bool isUnicodeWhitespace(uint32_t cp) {
    return (cp >= 0x09 && cp <= 0x0D)
        || cp == 0x20
        || cp == 0x85
        || cp == 0xA0
        || cp == 0x1680
        || (cp >= 0x2000 && cp <= 0x200A)
        || cp == 0x2028
        || cp == 0x2029
        || cp == 0x202F
        || cp == 0x205F
        || cp == 0x3000;
}

std::string trimWhitespace(const std::string& text) {
    size_t begin = 0;
    while (begin < text.size()) {
        uint32_t cp;
        size_t length = decodeAt(text, begin, cp);
        if (length == 0 || !isUnicodeWhitespace(cp)) {
            break;
        }
        begin += length;
    }

    size_t end = text.size();
    while (end > begin) {
        size_t start = previousStart(text, end);
        uint32_t cp;
        size_t length = decodeAt(text, start, cp);
        if (length != end - start || !isUnicodeWhitespace(cp)) {
            break;
        }
        end = start;
    }
    return text.substr(begin, end - begin);
}

} // namespace tempconv::core
