/*
 * ID3v2Utils.cpp - ID3v2 integer, unsynchronisation and text codecs
 * This file is part of TagSmith.
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tagsmith.h"

namespace TagSmith {
namespace Tag {
namespace ID3v2Utils {

using Core::Utility::UTF8Util;

// ============================================================================
// Bit-padded Integer Functions
// ============================================================================

uint32_t decodeBitPadded(const uint8_t* data, size_t size, unsigned bits) {
    if (!data) {
        return 0;
    }
    const uint32_t mask = (1u << bits) - 1;
    uint32_t result = 0;
    for (size_t i = 0; i < size; ++i) {
        result = (result << bits) | (data[i] & mask);
    }
    return result;
}

std::vector<uint8_t> encodeBitPadded(uint32_t value, size_t width, unsigned bits) {
    std::vector<uint8_t> result(width, 0);
    const uint32_t mask = (1u << bits) - 1;
    uint64_t remaining = value;
    for (size_t i = width; i > 0; --i) {
        result[i - 1] = static_cast<uint8_t>(remaining & mask);
        remaining >>= bits;
    }
    return result;
}

bool canEncodeSynchsafe(uint32_t value) {
    return value <= TagConstants::MAX_SYNCHSAFE_VALUE;
}

uint32_t decodeSynchsafeBytes(const uint8_t* data) {
    return decodeBitPadded(data, 4, 7);
}

void encodeSynchsafeBytes(uint32_t value, uint8_t* out) {
    if (!out) {
        return;
    }
    out[0] = static_cast<uint8_t>((value >> 21) & 0x7F);
    out[1] = static_cast<uint8_t>((value >> 14) & 0x7F);
    out[2] = static_cast<uint8_t>((value >> 7) & 0x7F);
    out[3] = static_cast<uint8_t>(value & 0x7F);
}

uint32_t decodeBigEndian32(const uint8_t* data) {
    return decodeBitPadded(data, 4, 8);
}

// ============================================================================
// Unsynchronization Functions
// ============================================================================

std::vector<uint8_t> decodeUnsync(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return {};
    }

    std::vector<uint8_t> result;
    result.reserve(size);

    size_t i = 0;
    while (i < size) {
        result.push_back(data[i]);
        if (data[i] == 0xFF && i + 1 < size && data[i + 1] == 0x00) {
            i += 2;
        } else {
            ++i;
        }
    }

    return result;
}

std::vector<uint8_t> encodeUnsync(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return {};
    }

    std::vector<uint8_t> result;
    result.reserve(size + size / 10);

    for (size_t i = 0; i < size; ++i) {
        result.push_back(data[i]);
        if (data[i] == 0xFF) {
            result.push_back(0x00);
        }
    }

    return result;
}

bool needsUnsync(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        return false;
    }

    for (size_t i = 0; i < size; ++i) {
        if (data[i] == 0xFF) {
            if (i + 1 == size || data[i + 1] == 0x00 || data[i + 1] >= 0xE0) {
                return true;
            }
        }
    }

    return false;
}

// ============================================================================
// Text Encoding Functions
// ============================================================================

TextEncoding encodingFromByte(uint8_t b) {
    if (b > 3) {
        throw Core::ID3Exception("Invalid encoding byte: " + std::to_string(b));
    }
    return static_cast<TextEncoding>(b);
}

TextEncoding defaultEncodingForVersion(uint8_t version) {
    return version >= 4 ? TextEncoding::UTF8 : TextEncoding::UTF16;
}

size_t nullTerminatorSize(TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::UTF16:
        case TextEncoding::UTF16BE:
            return 2;
        case TextEncoding::Latin1:
        case TextEncoding::UTF8:
        default:
            return 1;
    }
}

size_t findNullTerminator(const uint8_t* data, size_t size, TextEncoding encoding) {
    if (!data || size == 0) {
        return size;
    }

    if (nullTerminatorSize(encoding) == 1) {
        const void* hit = std::memchr(data, 0, size);
        return hit ? static_cast<size_t>(static_cast<const uint8_t*>(hit) - data) : size;
    }

    for (size_t i = 0; i + 1 < size; i += 2) {
        if (data[i] == 0x00 && data[i + 1] == 0x00) {
            return i;
        }
    }
    return size;
}

std::string decodeText(const uint8_t* data, size_t size, TextEncoding encoding) {
    if (!data || size == 0) {
        return "";
    }

    switch (encoding) {
        case TextEncoding::Latin1:
            return UTF8Util::fromLatin1(data, size);
        case TextEncoding::UTF16:
            return UTF8Util::fromUTF16(data, size, false, true);
        case TextEncoding::UTF16BE:
            return UTF8Util::fromUTF16(data, size, true, false);
        case TextEncoding::UTF8:
            if (UTF8Util::isValid(data, size)) {
                return std::string(reinterpret_cast<const char*>(data), size);
            }
            return UTF8Util::repair(data, size);
    }
    return UTF8Util::fromLatin1(data, size);
}

std::vector<std::string> splitText(const std::string& text) {
    std::vector<std::string> values;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\0', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        if (end > start) {
            values.emplace_back(text, start, end - start);
        }
        start = end + 1;
    }
    return values;
}

std::pair<std::string, size_t> readEncodedText(const uint8_t* data, size_t size, TextEncoding encoding) {
    size_t pos = findNullTerminator(data, size, encoding);
    if (pos < size) {
        return {decodeText(data, pos, encoding), pos + nullTerminatorSize(encoding)};
    }
    return {decodeText(data, size, encoding), size};
}

std::pair<std::string, size_t> readLatin1Text(const uint8_t* data, size_t size) {
    return readEncodedText(data, size, TextEncoding::Latin1);
}

std::vector<uint8_t> encodeText(const std::string& text, TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::Latin1:
            return UTF8Util::toLatin1(text);
        case TextEncoding::UTF16: {
            std::vector<uint8_t> result = {0xFF, 0xFE};
            auto units = UTF8Util::toUTF16LE(text);
            result.insert(result.end(), units.begin(), units.end());
            return result;
        }
        case TextEncoding::UTF16BE:
            return UTF8Util::toUTF16BE(text);
        case TextEncoding::UTF8:
            return std::vector<uint8_t>(text.begin(), text.end());
    }
    return UTF8Util::toLatin1(text);
}

} // namespace ID3v2Utils
} // namespace Tag
} // namespace TagSmith
