/*
 * UTF8Util.h - UTF-8 encoding/decoding utilities for tag text
 * This file is part of TagSmith.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGSMITH_CORE_UTILITY_UTF8UTIL_H
#define TAGSMITH_CORE_UTILITY_UTF8UTIL_H

#include <cstdint>
#include <string>
#include <vector>

namespace TagSmith {
namespace Core {
namespace Utility {

/**
 * @brief UTF-8 conversion helpers used by the ID3 text codec
 *
 * All text handed out by TagSmith is UTF-8. Decoding is lenient: malformed
 * input produces U+FFFD instead of failing, and embedded U+0000 characters
 * are kept so callers can split multi-value fields themselves.
 *
 * Thread Safety: All methods are stateless and thread-safe.
 */
class UTF8Util {
public:
    // ========================================================================
    // UTF-8 Validation
    // ========================================================================

    /**
     * @brief Check if a byte sequence is valid UTF-8
     * @param data Pointer to data
     * @param size Size of data
     * @return true if valid UTF-8, false otherwise
     */
    static bool isValid(const uint8_t* data, size_t size);
    static bool isValid(const std::string& text);

    /**
     * @brief Replace invalid sequences with U+FFFD
     * @param data Pointer to possibly-invalid UTF-8
     * @param size Size of data
     * @return Valid UTF-8 string of the same logical content
     */
    static std::string repair(const uint8_t* data, size_t size);
    static std::string repair(const std::string& text);

    // ========================================================================
    // ISO-8859-1 (Latin-1) Conversion
    // ========================================================================

    /**
     * @brief Decode ISO-8859-1 to UTF-8
     *
     * Every byte maps to U+0000..U+00FF, including 0x00.
     */
    static std::string fromLatin1(const uint8_t* data, size_t size);

    /**
     * @brief Encode UTF-8 to ISO-8859-1
     *
     * Characters outside Latin-1 range are replaced with '?'
     */
    static std::vector<uint8_t> toLatin1(const std::string& text);

    // ========================================================================
    // UTF-16 Conversion
    // ========================================================================

    /**
     * @brief Decode UTF-16 to UTF-8
     *
     * Surrogate pairs are combined; lone surrogates become U+FFFD. A trailing
     * odd byte is ignored.
     *
     * @param data Pointer to UTF-16 data
     * @param size Size of data in bytes
     * @param bigEndian Initial byte order
     * @param detectBom When true, a byte order mark at the start of the data
     *        or directly after a U+0000 unit selects the byte order for the
     *        following text and is not copied to the output.
     * @return UTF-8 encoded string
     */
    static std::string fromUTF16(const uint8_t* data, size_t size, bool bigEndian, bool detectBom);

    /**
     * @brief Encode UTF-8 to UTF-16 Little Endian (no BOM)
     */
    static std::vector<uint8_t> toUTF16LE(const std::string& text);

    /**
     * @brief Encode UTF-8 to UTF-16 Big Endian (no BOM)
     */
    static std::vector<uint8_t> toUTF16BE(const std::string& text);

    // ========================================================================
    // Codepoint Operations
    // ========================================================================

    /**
     * @brief Decode first codepoint from UTF-8 data
     *
     * @param data Pointer to UTF-8 data
     * @param size Size of data
     * @param bytesConsumed Output: number of bytes consumed (at least 1
     *        when size > 0)
     * @return Unicode codepoint, or 0xFFFD on error
     */
    static uint32_t decodeCodepoint(const uint8_t* data, size_t size, size_t& bytesConsumed);

    /**
     * @brief Encode a single Unicode codepoint to UTF-8
     */
    static std::string encodeCodepoint(uint32_t codepoint);

    static bool isValidCodepoint(uint32_t codepoint);

    /**
     * @brief Get the replacement character (U+FFFD) as UTF-8
     */
    static const std::string& replacementCharacter();

private:
    static void appendCodepoint(std::string& output, uint32_t codepoint);
    static std::vector<uint8_t> toUTF16(const std::string& text, bool bigEndian);
};

} // namespace Utility
} // namespace Core
} // namespace TagSmith

#endif // TAGSMITH_CORE_UTILITY_UTF8UTIL_H
