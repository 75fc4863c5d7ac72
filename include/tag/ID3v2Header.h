/*
 * ID3v2Header.h - ID3v2 tag header parsing and frame size heuristics
 * This file is part of TagSmith.
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGSMITH_TAG_ID3V2HEADER_H
#define TAGSMITH_TAG_ID3V2HEADER_H

#include <cstdint>
#include <cstddef>

namespace TagSmith {
namespace Tag {

/**
 * @brief Flags byte of the 10-byte ID3v2 header
 */
struct TagFlags {
    bool unsynchronisation = false;  ///< bit 7
    bool extended = false;           ///< bit 6
    bool experimental = false;       ///< bit 5
    bool footer = false;             ///< bit 4, v2.4 only
};

/**
 * @brief Decoded ID3v2 header
 *
 * "ID3" · major · revision · flags · syncsafe size. The size excludes the
 * header itself and any footer.
 */
struct TagHeader {
    uint8_t major = 4;
    uint8_t revision = 0;
    TagFlags flags;
    uint32_t size = 0;
    uint64_t offset = 0;    ///< Where the header starts in the file

    /**
     * @brief Parse the first 10 bytes of a candidate tag
     *
     * @param data Candidate bytes
     * @param size Number of bytes available
     * @param offset File offset of @p data, recorded in the result
     * @throws Core::ID3NoHeaderException fewer than 10 bytes or no "ID3" magic
     * @throws Core::ID3UnsupportedVersionException major version outside 2..4
     */
    static TagHeader parse(const uint8_t* data, size_t size, uint64_t offset = 0);

    /**
     * @brief Non-throwing probe for a parsable header
     */
    static bool isValid(const uint8_t* data, size_t size);

    /**
     * @brief Header + body, plus the footer when present
     */
    uint32_t fullSize() const;
};

/**
 * @brief Pick the bit width of v2.4 frame size fields
 *
 * Some encoders write v2.4 frame sizes as plain 32-bit integers. Walks the
 * frame region once with 7-bit and once with 8-bit sizes and counts the
 * frames each reading validates.
 *
 * @param data Start of the frame region (after any extended header)
 * @param size Length of the frame region
 * @return 7 when the syncsafe walk validates at least as many frames, else 8
 */
unsigned determineBpi(const uint8_t* data, size_t size);

/**
 * @brief True for a frame ID made only of A-Z and 0-9
 */
bool isValidFrameId(const uint8_t* id, size_t length);

} // namespace Tag
} // namespace TagSmith

#endif // TAGSMITH_TAG_ID3V2HEADER_H
