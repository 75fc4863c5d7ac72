/*
 * ID3v2Writer.h - Whole-tag serialisation
 * This file is part of TagSmith.
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGSMITH_TAG_ID3V2WRITER_H
#define TAGSMITH_TAG_ID3V2WRITER_H

#include <vector>

namespace TagSmith {
namespace Tag {

/**
 * @brief Writer settings
 */
struct ID3WriteOptions {
    uint8_t version = 4;                              ///< 3 or 4
    size_t padding = TagConstants::DEFAULT_PADDING;   ///< Zero bytes after the frames
};

/**
 * @brief Build a complete tag: header, frames, padding
 *
 * The header carries revision 0 and no flags. Versions below 3 are written
 * as 3 and versions above 4 as 4.
 *
 * @throws Core::ID3Exception when the frames and padding do not fit in a
 *         syncsafe tag size
 */
std::vector<uint8_t> renderTag(const ID3v2Tag& tags, const ID3WriteOptions& options = ID3WriteOptions());

} // namespace Tag
} // namespace TagSmith

#endif // TAGSMITH_TAG_ID3V2WRITER_H
