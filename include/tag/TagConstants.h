/*
 * TagConstants.h - Constants for the tag engine
 * This file is part of TagSmith.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGSMITH_TAG_TAGCONSTANTS_H
#define TAGSMITH_TAG_TAGCONSTANTS_H

#include <cstdint>
#include <cstddef>

namespace TagSmith {
namespace Tag {

namespace TagConstants {

// ID3v2 tag header, also the size of the optional v2.4 footer
constexpr size_t ID3V2_HEADER_SIZE = 10;

// Frame headers: v2.2 uses 3-byte ID + 3-byte size
constexpr size_t ID3V22_FRAME_HEADER_SIZE = 6;
constexpr size_t ID3V2_FRAME_HEADER_SIZE = 10;

// Trailing legacy tag
constexpr size_t ID3V1_TAG_SIZE = 128;

// Zero bytes appended after the frames when rendering a tag
constexpr size_t DEFAULT_PADDING = 1024;

// Largest value a 4-byte syncsafe integer can hold
constexpr uint32_t MAX_SYNCHSAFE_VALUE = 0x0FFFFFFF;

// Per-frame flag bits, v2.4 layout
constexpr uint16_t V24_FLAG_COMPRESSION = 0x0008;
constexpr uint16_t V24_FLAG_ENCRYPTION = 0x0004;
constexpr uint16_t V24_FLAG_UNSYNCHRONISATION = 0x0002;
constexpr uint16_t V24_FLAG_DATA_LENGTH = 0x0001;

// Per-frame flag bits, v2.3 layout
constexpr uint16_t V23_FLAG_COMPRESSION = 0x0080;
constexpr uint16_t V23_FLAG_ENCRYPTION = 0x0040;

} // namespace TagConstants

} // namespace Tag
} // namespace TagSmith

#endif // TAGSMITH_TAG_TAGCONSTANTS_H
