/*
 * ID3File.cpp - Load, save and strip ID3 tags on disk
 * This file is part of TagSmith.
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tagsmith.h"

namespace TagSmith {
namespace Tag {

using IO::RAIIFileHandle;
using IO::make_file_handle;

void ID3File::mergeID3v1(ID3v2Tag& tags, const uint8_t* data, size_t size) {
    for (auto& frame : ID3v1Tag::parse(data, size)) {
        if (tags.contains(frame.hashKey())) {
            Debug::log("id3v1", "ID3File::mergeID3v1: ", frame.hashKey().str(), " already set by ID3v2");
            continue;
        }
        tags.add(std::move(frame));
    }
}

void ID3File::readBody(LoadResult& result, std::vector<uint8_t> body) {
    const TagHeader& header = *result.header;
    if (header.flags.unsynchronisation && header.major < 4) {
        body = ID3v2Utils::decodeUnsync(body.data(), body.size());
    }
    result.tags.readFrames(body.data(), body.size(), header);
}

size_t ID3File::existingTagSize(const std::vector<uint8_t>& data) {
    if (!TagHeader::isValid(data.data(), data.size())) {
        return 0;
    }
    try {
        TagHeader header = TagHeader::parse(data.data(), data.size());
        return std::min<size_t>(header.fullSize(), data.size());
    } catch (const Core::ID3Exception& e) {
        Debug::log("id3", "ID3File: ignoring unreadable tag header: ", e.what());
        return 0;
    }
}

LoadResult ID3File::loadFromData(const uint8_t* data, size_t size) {
    LoadResult result;

    try {
        result.header = TagHeader::parse(data, size);
    } catch (const Core::ID3NoHeaderException&) {
        Debug::log("id3", "ID3File::loadFromData: no ID3v2 tag, trying ID3v1");
        mergeID3v1(result.tags, data, size);
        return result;
    }

    size_t end = std::min<size_t>(TagConstants::ID3V2_HEADER_SIZE + result.header->size, size);
    readBody(result, std::vector<uint8_t>(data + TagConstants::ID3V2_HEADER_SIZE, data + end));
    mergeID3v1(result.tags, data, size);
    return result;
}

LoadResult ID3File::load(const std::string& path) {
    RAIIFileHandle file = make_file_handle(path.c_str(), "rb");

    uint8_t header_buf[TagConstants::ID3V2_HEADER_SIZE];
    size_t got = file.readSome(header_buf, sizeof(header_buf));
    if (got < sizeof(header_buf)) {
        return loadFromData(header_buf, got);
    }

    LoadResult result;
    try {
        result.header = TagHeader::parse(header_buf, got);
    } catch (const Core::ID3NoHeaderException&) {
        Debug::log("id3", "ID3File::load: ", path, " has no ID3v2 tag");
    }

    if (result.header) {
        std::vector<uint8_t> body(result.header->size);
        size_t read = file.readSome(body.data(), body.size());
        if (read < body.size()) {
            Debug::log("id3", "ID3File::load: tag claims ", body.size(), " bytes, file holds ", read);
            body.resize(read);
        }
        readBody(result, std::move(body));
    }

    off_t length = file.size();
    if (length >= static_cast<off_t>(ID3v1Tag::TAG_SIZE)) {
        uint8_t v1_buf[ID3v1Tag::TAG_SIZE];
        file.seek(length - static_cast<off_t>(ID3v1Tag::TAG_SIZE), SEEK_SET);
        if (file.readSome(v1_buf, sizeof(v1_buf)) == sizeof(v1_buf)) {
            mergeID3v1(result.tags, v1_buf, sizeof(v1_buf));
        }
    }

    return result;
}

void ID3File::save(const std::string& path, const ID3v2Tag& tags, const ID3WriteOptions& options) {
    RAIIFileHandle file = make_file_handle(path.c_str(), "r+b");
    std::vector<uint8_t> existing = file.readAll();

    size_t old_tag_size = existingTagSize(existing);
    std::vector<uint8_t> new_tag = renderTag(tags, options);

    file.seek(0, SEEK_SET);
    file.writeAll(new_tag.data(), new_tag.size());
    file.writeAll(existing.data() + old_tag_size, existing.size() - old_tag_size);
    file.truncate(static_cast<off_t>(new_tag.size() + existing.size() - old_tag_size));
    if (file.close() != 0) {
        throw Core::IOException("cannot close " + path + ": " + strerror(errno));
    }

    Debug::log("io", "ID3File::save: ", path, ": replaced ", old_tag_size, " byte tag with ",
               new_tag.size(), " bytes");
}

void ID3File::remove(const std::string& path) {
    RAIIFileHandle file = make_file_handle(path.c_str(), "r+b");
    std::vector<uint8_t> existing = file.readAll();

    size_t start = existingTagSize(existing);
    size_t end = existing.size();
    if (ID3v1Tag::findID3v1(existing.data() + start, end - start)) {
        end -= ID3v1Tag::TAG_SIZE;
    }

    if (start == 0 && end == existing.size()) {
        Debug::log("io", "ID3File::remove: ", path, " carries no tags");
        return;
    }

    file.seek(0, SEEK_SET);
    file.writeAll(existing.data() + start, end - start);
    file.truncate(static_cast<off_t>(end - start));
    if (file.close() != 0) {
        throw Core::IOException("cannot close " + path + ": " + strerror(errno));
    }

    Debug::log("io", "ID3File::remove: ", path, ": stripped ", start, " leading and ",
               existing.size() - end, " trailing bytes");
}

} // namespace Tag
} // namespace TagSmith
