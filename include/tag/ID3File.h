/*
 * ID3File.h - Load, save and strip ID3 tags on disk
 * This file is part of TagSmith.
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGSMITH_TAG_ID3FILE_H
#define TAGSMITH_TAG_ID3FILE_H

#include <optional>
#include <string>

namespace TagSmith {
namespace Tag {

/**
 * @brief Result of a load: the frames plus the ID3v2 header, if any
 *
 * header is empty when the file has no ID3v2 tag; tags then holds the
 * ID3v1 frames only (possibly none).
 */
struct LoadResult {
    ID3v2Tag tags;
    std::optional<TagHeader> header;
};

/**
 * @brief Read-modify-write of the ID3 tags of one file
 *
 * Audio data around the tags is never interpreted; save() and remove()
 * copy it through byte for byte.
 */
class ID3File {
public:
    ID3File() = delete;

    /**
     * @brief Read the ID3v2 tag at the start of a file and any trailing ID3v1
     *
     * Only the header, the tag body and the last 128 bytes are read.
     * ID3v1 fields are merged only when their key is not already present.
     *
     * @throws Core::IOException if the file cannot be opened or read
     * @throws Core::ID3UnsupportedVersionException for majors outside 2..4
     */
    static LoadResult load(const std::string& path);

    /**
     * @brief Same as load() over bytes already in memory
     */
    static LoadResult loadFromData(const uint8_t* data, size_t size);

    /**
     * @brief Replace the leading tag with a freshly rendered one
     *
     * Writes [new tag][bytes after old tag] and truncates the file to the
     * new length. An unreadable old header counts as no tag.
     */
    static void save(const std::string& path, const ID3v2Tag& tags,
                     const ID3WriteOptions& options = ID3WriteOptions());

    /**
     * @brief Strip the leading ID3v2 tag and the trailing ID3v1 tag
     *
     * Either may be absent; with neither present the file is not touched.
     */
    static void remove(const std::string& path);

private:
    static void mergeID3v1(ID3v2Tag& tags, const uint8_t* data, size_t size);
    static void readBody(LoadResult& result, std::vector<uint8_t> body);
    static size_t existingTagSize(const std::vector<uint8_t>& data);
};

} // namespace Tag
} // namespace TagSmith

#endif // TAGSMITH_TAG_ID3FILE_H
