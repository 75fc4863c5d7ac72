/*
 * UTF8Util.cpp - UTF-8 encoding/decoding utilities implementation
 * This file is part of TagSmith.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tagsmith.h"

namespace TagSmith {
namespace Core {
namespace Utility {

static const std::string REPLACEMENT_CHAR = "\xEF\xBF\xBD"; // U+FFFD

const std::string& UTF8Util::replacementCharacter() {
    return REPLACEMENT_CHAR;
}

bool UTF8Util::isValidCodepoint(uint32_t codepoint) {
    // U+0000 to U+10FFFF, excluding surrogates
    return codepoint <= 0x10FFFF && (codepoint < 0xD800 || codepoint > 0xDFFF);
}

void UTF8Util::appendCodepoint(std::string& output, uint32_t codepoint) {
    if (codepoint < 0x80) {
        output += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        output += static_cast<char>(0xC0 | (codepoint >> 6));
        output += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        output += static_cast<char>(0xE0 | (codepoint >> 12));
        output += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint <= 0x10FFFF) {
        output += static_cast<char>(0xF0 | (codepoint >> 18));
        output += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        output += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        output += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        output += REPLACEMENT_CHAR;
    }
}

std::string UTF8Util::encodeCodepoint(uint32_t codepoint) {
    std::string result;
    appendCodepoint(result, codepoint);
    return result;
}

uint32_t UTF8Util::decodeCodepoint(const uint8_t* data, size_t size, size_t& bytesConsumed) {
    if (!data || size == 0) {
        bytesConsumed = 0;
        return 0xFFFD;
    }

    uint8_t c = data[0];

    if (c < 0x80) {
        bytesConsumed = 1;
        return c;
    } else if ((c & 0xE0) == 0xC0) {
        if (size < 2 || (data[1] & 0xC0) != 0x80) {
            bytesConsumed = 1;
            return 0xFFFD;
        }
        bytesConsumed = 2;
        // Overlong
        if ((c & 0x1E) == 0) {
            return 0xFFFD;
        }
        return ((c & 0x1F) << 6) | (data[1] & 0x3F);
    } else if ((c & 0xF0) == 0xE0) {
        if (size < 3 || (data[1] & 0xC0) != 0x80 || (data[2] & 0xC0) != 0x80) {
            bytesConsumed = 1;
            return 0xFFFD;
        }
        bytesConsumed = 3;
        if (c == 0xE0 && (data[1] & 0x20) == 0) {
            return 0xFFFD;
        }
        uint32_t cp = ((c & 0x0F) << 12) | ((data[1] & 0x3F) << 6) | (data[2] & 0x3F);
        if (cp >= 0xD800 && cp <= 0xDFFF) {
            return 0xFFFD;
        }
        return cp;
    } else if ((c & 0xF8) == 0xF0) {
        if (size < 4 || (data[1] & 0xC0) != 0x80 ||
            (data[2] & 0xC0) != 0x80 || (data[3] & 0xC0) != 0x80) {
            bytesConsumed = 1;
            return 0xFFFD;
        }
        bytesConsumed = 4;
        if (c == 0xF0 && (data[1] & 0x30) == 0) {
            return 0xFFFD;
        }
        uint32_t cp = ((c & 0x07) << 18) | ((data[1] & 0x3F) << 12) |
                      ((data[2] & 0x3F) << 6) | (data[3] & 0x3F);
        if (cp > 0x10FFFF) {
            return 0xFFFD;
        }
        return cp;
    }

    // Stray continuation or invalid lead byte
    bytesConsumed = 1;
    return 0xFFFD;
}

bool UTF8Util::isValid(const uint8_t* data, size_t size) {
    size_t i = 0;
    while (i < size) {
        size_t consumed;
        uint32_t cp = decodeCodepoint(data + i, size - i, consumed);
        if (cp == 0xFFFD && !(consumed == 3 && data[i] == 0xEF &&
                              data[i + 1] == 0xBF && data[i + 2] == 0xBD)) {
            return false;
        }
        i += consumed;
    }
    return true;
}

bool UTF8Util::isValid(const std::string& text) {
    return isValid(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::string UTF8Util::repair(const uint8_t* data, size_t size) {
    std::string result;
    result.reserve(size);

    size_t i = 0;
    while (i < size) {
        size_t consumed;
        uint32_t cp = decodeCodepoint(data + i, size - i, consumed);
        appendCodepoint(result, cp);
        i += consumed;
    }

    return result;
}

std::string UTF8Util::repair(const std::string& text) {
    return repair(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

// ============================================================================
// ISO-8859-1 (Latin-1) Conversion
// ============================================================================

std::string UTF8Util::fromLatin1(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return "";
    }

    std::string result;
    result.reserve(size * 2);

    for (size_t i = 0; i < size; ++i) {
        uint8_t c = data[i];
        if (c < 0x80) {
            result += static_cast<char>(c);
        } else {
            // 0x80-0xFF map to U+0080..U+00FF
            result += static_cast<char>(0xC0 | (c >> 6));
            result += static_cast<char>(0x80 | (c & 0x3F));
        }
    }

    return result;
}

std::vector<uint8_t> UTF8Util::toLatin1(const std::string& text) {
    std::vector<uint8_t> result;
    result.reserve(text.size());

    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(text.data());
    size_t i = 0;
    while (i < text.size()) {
        size_t consumed;
        uint32_t cp = decodeCodepoint(bytes + i, text.size() - i, consumed);
        result.push_back(cp <= 0xFF ? static_cast<uint8_t>(cp) : '?');
        i += consumed;
    }

    return result;
}

// ============================================================================
// UTF-16 Conversion
// ============================================================================

std::string UTF8Util::fromUTF16(const uint8_t* data, size_t size, bool bigEndian, bool detectBom) {
    if (!data || size < 2) {
        return "";
    }

    auto unitAt = [&](size_t pos) -> uint16_t {
        if (bigEndian) {
            return static_cast<uint16_t>((data[pos] << 8) | data[pos + 1]);
        }
        return static_cast<uint16_t>(data[pos] | (data[pos + 1] << 8));
    };

    std::string result;
    result.reserve(size);

    bool valueStart = true;
    size_t i = 0;
    while (i + 1 < size) {
        uint16_t unit = unitAt(i);

        if (detectBom && valueStart) {
            valueStart = false;
            if (unit == 0xFEFF) {
                i += 2;
                continue;
            }
            if (unit == 0xFFFE) {
                bigEndian = !bigEndian;
                i += 2;
                continue;
            }
        }

        if (unit == 0x0000) {
            result += '\0';
            valueStart = true;
            i += 2;
            continue;
        }

        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (i + 3 < size) {
                uint16_t low = unitAt(i + 2);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    uint32_t codepoint = 0x10000 +
                        ((static_cast<uint32_t>(unit - 0xD800) << 10) | (low - 0xDC00));
                    appendCodepoint(result, codepoint);
                    i += 4;
                    continue;
                }
            }
            result += REPLACEMENT_CHAR;
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            // Orphan low surrogate
            result += REPLACEMENT_CHAR;
        } else {
            appendCodepoint(result, unit);
        }
        i += 2;
    }

    return result;
}

std::vector<uint8_t> UTF8Util::toUTF16(const std::string& text, bool bigEndian) {
    std::vector<uint8_t> result;
    result.reserve(text.size() * 2);

    auto pushUnit = [&](uint16_t unit) {
        if (bigEndian) {
            result.push_back(static_cast<uint8_t>(unit >> 8));
            result.push_back(static_cast<uint8_t>(unit & 0xFF));
        } else {
            result.push_back(static_cast<uint8_t>(unit & 0xFF));
            result.push_back(static_cast<uint8_t>(unit >> 8));
        }
    };

    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(text.data());
    size_t i = 0;
    while (i < text.size()) {
        size_t consumed;
        uint32_t codepoint = decodeCodepoint(bytes + i, text.size() - i, consumed);
        i += consumed;

        if (codepoint < 0x10000) {
            pushUnit(static_cast<uint16_t>(codepoint));
        } else {
            codepoint -= 0x10000;
            pushUnit(static_cast<uint16_t>(0xD800 + ((codepoint >> 10) & 0x3FF)));
            pushUnit(static_cast<uint16_t>(0xDC00 + (codepoint & 0x3FF)));
        }
    }

    return result;
}

std::vector<uint8_t> UTF8Util::toUTF16LE(const std::string& text) {
    return toUTF16(text, false);
}

std::vector<uint8_t> UTF8Util::toUTF16BE(const std::string& text) {
    return toUTF16(text, true);
}

} // namespace Utility
} // namespace Core
} // namespace TagSmith
