/*
 * ID3v2Utils.h - ID3v2 integer, unsynchronisation and text codecs
 * This file is part of TagSmith.
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGSMITH_TAG_ID3V2UTILS_H
#define TAGSMITH_TAG_ID3V2UTILS_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace TagSmith {
namespace Tag {
namespace ID3v2Utils {

/**
 * @brief ID3v2 text encoding types
 */
enum class TextEncoding : uint8_t {
    Latin1 = 0,   ///< ISO-8859-1
    UTF16 = 1,    ///< UTF-16 with BOM (little-endian when the BOM is missing)
    UTF16BE = 2,  ///< UTF-16 Big Endian, no BOM
    UTF8 = 3      ///< UTF-8, ID3v2.4 only
};

// ============================================================================
// Bit-padded Integer Functions
// ============================================================================

/**
 * @brief Decode a big-endian integer using the low @p bits of each byte
 *
 * bits = 7 reads a syncsafe integer, bits = 8 a plain one.
 */
uint32_t decodeBitPadded(const uint8_t* data, size_t size, unsigned bits);

/**
 * @brief Encode @p value into @p width big-endian bytes of @p bits each
 *
 * High bits that do not fit are dropped.
 */
std::vector<uint8_t> encodeBitPadded(uint32_t value, size_t width, unsigned bits);

/**
 * @brief Decode synchsafe integer from 4 raw bytes
 */
uint32_t decodeSynchsafeBytes(const uint8_t* data);

/**
 * @brief Encode synchsafe integer to 4 raw bytes
 * @param value Value to encode (must be <= 0x0FFFFFFF)
 * @param out Output buffer (must be at least 4 bytes)
 */
void encodeSynchsafeBytes(uint32_t value, uint8_t* out);

/**
 * @brief Plain 32-bit big-endian read
 */
uint32_t decodeBigEndian32(const uint8_t* data);

/**
 * @brief Check if a value can be encoded as synchsafe (fits in 28 bits)
 */
bool canEncodeSynchsafe(uint32_t value);

// ============================================================================
// Unsynchronization Functions
// ============================================================================

/**
 * @brief Decode unsynchronised data
 *
 * A 0x00 directly following 0xFF is dropped. Only that one byte is
 * affected, so FF 00 00 becomes FF 00.
 */
std::vector<uint8_t> decodeUnsync(const uint8_t* data, size_t size);

/**
 * @brief Encode data with unsynchronisation
 *
 * Inserts 0x00 after every 0xFF.
 */
std::vector<uint8_t> encodeUnsync(const uint8_t* data, size_t size);

/**
 * @brief Check if data contains a false sync pattern
 *
 * @return true for 0xFF followed by 0x00, by a byte >= 0xE0, or at the end
 */
bool needsUnsync(const uint8_t* data, size_t size);

// ============================================================================
// Text Encoding Functions
// ============================================================================

/**
 * @brief Validate an encoding byte
 * @throws TagSmith::Core::ID3Exception for values above 3
 */
TextEncoding encodingFromByte(uint8_t b);

/**
 * @brief UTF-8 for v2.4, UTF-16 for earlier versions
 */
TextEncoding defaultEncodingForVersion(uint8_t version);

/**
 * @brief 1 for Latin-1/UTF-8, 2 for UTF-16 variants
 */
size_t nullTerminatorSize(TextEncoding encoding);

/**
 * @brief Find the encoding's terminator
 *
 * UTF-16 terminators are only matched on 2-byte aligned positions.
 *
 * @return Offset of the terminator, or size if none is present
 */
size_t findNullTerminator(const uint8_t* data, size_t size, TextEncoding encoding);

/**
 * @brief Decode a complete text range to UTF-8
 *
 * Embedded terminators are kept as U+0000 so multi-value fields can be
 * split afterwards with splitText().
 */
std::string decodeText(const uint8_t* data, size_t size, TextEncoding encoding);

/**
 * @brief Split decoded text on U+0000, dropping empty segments
 */
std::vector<std::string> splitText(const std::string& text);

/**
 * @brief Read one terminated string
 *
 * @return (text, bytes consumed including the terminator). Without a
 *         terminator the whole range is consumed.
 */
std::pair<std::string, size_t> readEncodedText(const uint8_t* data, size_t size, TextEncoding encoding);

/**
 * @brief readEncodedText() for unprefixed Latin-1 fields (MIME, e-mail)
 */
std::pair<std::string, size_t> readLatin1Text(const uint8_t* data, size_t size);

/**
 * @brief Encode UTF-8 text without terminator
 *
 * Latin-1 writes '?' for code points above U+00FF. UTF16 is written
 * little-endian behind an FF FE byte order mark.
 */
std::vector<uint8_t> encodeText(const std::string& text, TextEncoding encoding);

} // namespace ID3v2Utils
} // namespace Tag
} // namespace TagSmith

#endif // TAGSMITH_TAG_ID3V2UTILS_H
