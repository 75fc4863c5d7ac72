/*
 * ID3v2Writer.cpp - Whole-tag serialisation
 * This file is part of TagSmith.
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tagsmith.h"

namespace TagSmith {
namespace Tag {

std::vector<uint8_t> renderTag(const ID3v2Tag& tags, const ID3WriteOptions& options) {
    uint8_t version = std::min<uint8_t>(std::max<uint8_t>(options.version, 3), 4);

    std::vector<uint8_t> frames = tags.render(version);
    size_t body_size = frames.size() + options.padding;
    if (body_size > TagConstants::MAX_SYNCHSAFE_VALUE) {
        throw Core::ID3Exception("Tag too large: " + std::to_string(body_size) + " bytes");
    }

    std::vector<uint8_t> out;
    out.reserve(TagConstants::ID3V2_HEADER_SIZE + body_size);
    out.insert(out.end(), {'I', 'D', '3', version, 0, 0});

    uint8_t size_bytes[4];
    ID3v2Utils::encodeSynchsafeBytes(static_cast<uint32_t>(body_size), size_bytes);
    out.insert(out.end(), size_bytes, size_bytes + 4);

    out.insert(out.end(), frames.begin(), frames.end());
    out.insert(out.end(), options.padding, 0);

    Debug::log("id3", "renderTag: v2.", static_cast<int>(version), " ", frames.size(),
               " bytes of frames, ", options.padding, " bytes padding");
    return out;
}

} // namespace Tag
} // namespace TagSmith
