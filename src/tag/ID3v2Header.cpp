/*
 * ID3v2Header.cpp - ID3v2 tag header parsing and frame size heuristics
 * This file is part of TagSmith.
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tagsmith.h"

namespace TagSmith {
namespace Tag {

TagHeader TagHeader::parse(const uint8_t* data, size_t size, uint64_t offset) {
    if (!data || size < TagConstants::ID3V2_HEADER_SIZE) {
        throw Core::ID3NoHeaderException();
    }
    if (std::memcmp(data, "ID3", 3) != 0) {
        throw Core::ID3NoHeaderException();
    }

    TagHeader header;
    header.major = data[3];
    header.revision = data[4];

    if (header.major < 2 || header.major > 4) {
        Debug::log("id3", "TagHeader::parse: unsupported version 2.",
                   static_cast<int>(header.major), ".", static_cast<int>(header.revision));
        throw Core::ID3UnsupportedVersionException(header.major, header.revision);
    }

    uint8_t flags = data[5];
    header.flags.unsynchronisation = (flags & 0x80) != 0;
    header.flags.extended = (flags & 0x40) != 0;
    header.flags.experimental = (flags & 0x20) != 0;
    header.flags.footer = header.major == 4 && (flags & 0x10) != 0;

    header.size = ID3v2Utils::decodeSynchsafeBytes(data + 6);
    header.offset = offset;

    Debug::log("id3", "TagHeader::parse: ID3v2.", static_cast<int>(header.major), ".",
               static_cast<int>(header.revision), " size=", header.size,
               " unsync=", header.flags.unsynchronisation,
               " extended=", header.flags.extended,
               " footer=", header.flags.footer);

    return header;
}

bool TagHeader::isValid(const uint8_t* data, size_t size) {
    if (!data || size < TagConstants::ID3V2_HEADER_SIZE) {
        return false;
    }
    return std::memcmp(data, "ID3", 3) == 0 && data[3] >= 2 && data[3] <= 4;
}

uint32_t TagHeader::fullSize() const {
    uint32_t total = size + TagConstants::ID3V2_HEADER_SIZE;
    if (flags.footer) {
        total += TagConstants::ID3V2_HEADER_SIZE;
    }
    return total;
}

bool isValidFrameId(const uint8_t* id, size_t length) {
    for (size_t i = 0; i < length; ++i) {
        bool upper = id[i] >= 'A' && id[i] <= 'Z';
        bool digit = id[i] >= '0' && id[i] <= '9';
        if (!upper && !digit) {
            return false;
        }
    }
    return true;
}

namespace {

// Number of consecutive well-formed frames when sizes are read with @bits
size_t countValidFrames(const uint8_t* data, size_t size, unsigned bits) {
    const size_t header_size = TagConstants::ID3V2_FRAME_HEADER_SIZE;
    size_t pos = 0;
    size_t valid = 0;

    while (pos + header_size <= size) {
        if (data[pos] == 0) {
            break;
        }
        if (!isValidFrameId(data + pos, 4)) {
            break;
        }
        size_t frame_size = ID3v2Utils::decodeBitPadded(data + pos + 4, 4, bits);
        if (frame_size == 0 || frame_size > size - pos - header_size) {
            break;
        }
        ++valid;
        pos += header_size + frame_size;
    }

    return valid;
}

} // anonymous namespace

unsigned determineBpi(const uint8_t* data, size_t size) {
    if (!data) {
        return 7;
    }
    size_t syncsafe_valid = countValidFrames(data, size, 7);
    size_t normal_valid = countValidFrames(data, size, 8);

    Debug::log("id3", "determineBpi: syncsafe walk=", syncsafe_valid,
               " frames, plain walk=", normal_valid, " frames");

    return syncsafe_valid >= normal_valid ? 7 : 8;
}

} // namespace Tag
} // namespace TagSmith
