/*
 * ID3v2Tag.cpp - Lazily decoded ID3v2 frame container
 * This file is part of TagSmith.
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tagsmith.h"

namespace TagSmith {
namespace Tag {

using namespace ID3v2Utils;
using Core::ID3Exception;

// ============================================================================
// LazyFrame
// ============================================================================

std::string LazyFrame::frameId() const {
    if (const auto* frame = std::get_if<ID3v2Frame>(&m_state)) {
        return frame->frameId();
    }
    if (const auto* raw = std::get_if<Raw>(&m_state)) {
        return raw->id;
    }
    const auto& slice = std::get<Slice>(m_state);
    return std::string(slice.id.data(), slice.id.size());
}

bool LazyFrame::decode(const std::vector<uint8_t>& buffer) {
    if (isDecoded()) {
        return false;
    }

    if (const auto* raw = std::get_if<Raw>(&m_state)) {
        ID3v2Frame frame = ID3v2Frame::parse(raw->id, raw->data.data(), raw->data.size());
        m_state = std::move(frame);
        return true;
    }

    const Slice slice = std::get<Slice>(m_state);
    if (static_cast<size_t>(slice.offset) + slice.length > buffer.size()) {
        throw ID3Exception("Frame slice outside of tag buffer");
    }
    ID3v2Frame frame = ID3v2Frame::parse(std::string(slice.id.data(), slice.id.size()),
                                         buffer.data() + slice.offset, slice.length);
    m_state = std::move(frame);
    return true;
}

std::vector<uint8_t> LazyFrame::payload(const std::vector<uint8_t>& buffer, uint8_t version) const {
    if (const auto* frame = std::get_if<ID3v2Frame>(&m_state)) {
        return frame->write(version);
    }
    if (const auto* raw = std::get_if<Raw>(&m_state)) {
        return raw->data;
    }
    const auto& slice = std::get<Slice>(m_state);
    if (static_cast<size_t>(slice.offset) + slice.length > buffer.size()) {
        throw ID3Exception("Frame slice outside of tag buffer");
    }
    return std::vector<uint8_t>(buffer.begin() + slice.offset,
                                buffer.begin() + slice.offset + slice.length);
}

// ============================================================================
// ID3v2Tag: bucket management
// ============================================================================

ID3v2Tag::Bucket* ID3v2Tag::findBucket(const HashKey& key) {
    for (auto& entry : m_frames) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

const ID3v2Tag::Bucket* ID3v2Tag::findBucket(const HashKey& key) const {
    for (const auto& entry : m_frames) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

ID3v2Tag::Bucket& ID3v2Tag::bucketFor(const HashKey& key) {
    if (Bucket* bucket = findBucket(key)) {
        return *bucket;
    }
    m_frames.emplace_back(key, Bucket());
    return m_frames.back().second;
}

void ID3v2Tag::add(ID3v2Frame frame) {
    HashKey key = frame.hashKey();
    bucketFor(key).emplace_back(std::move(frame));
}

void ID3v2Tag::addRaw(std::string id, std::vector<uint8_t> data) {
    HashKey key = quickHashKey(id, data.data(), data.size());
    bucketFor(key).emplace_back(LazyFrame::Raw{std::move(id), std::move(data)});
}

void ID3v2Tag::setall(const std::string& key, std::vector<ID3v2Frame> frames) {
    setall(HashKey::fromString(key), std::move(frames));
}

void ID3v2Tag::setall(const HashKey& key, std::vector<ID3v2Frame> frames) {
    if (frames.empty()) {
        delall(key);
        return;
    }

    Bucket cells;
    cells.reserve(frames.size());
    for (auto& frame : frames) {
        HashKey own = frame.hashKey();
        if (own != key) {
            Debug::log("id3", "ID3v2Tag::setall: ", own.str(), " frame stored under ", key.str());
        }
        cells.emplace_back(std::move(frame));
    }
    bucketFor(key) = std::move(cells);
}

void ID3v2Tag::delall(const std::string& key) {
    delall(HashKey::fromString(key));
}

void ID3v2Tag::delall(const HashKey& key) {
    m_frames.erase(std::remove_if(m_frames.begin(), m_frames.end(),
                                  [&key](const std::pair<HashKey, Bucket>& entry) {
                                      return entry.first == key;
                                  }),
                   m_frames.end());
}

void ID3v2Tag::setText(const std::string& id, std::vector<std::string> values) {
    TextFrame frame;
    frame.id = id;
    frame.encoding = TextEncoding::UTF8;
    frame.text = std::move(values);
    setall(HashKey(id), {ID3v2Frame(std::move(frame))});
}

// ============================================================================
// ID3v2Tag: lookup
// ============================================================================

std::vector<const ID3v2Frame*> ID3v2Tag::getall(const std::string& key) const {
    return getall(HashKey::fromString(key));
}

std::vector<const ID3v2Frame*> ID3v2Tag::getall(const HashKey& key) const {
    std::vector<const ID3v2Frame*> result;
    if (const Bucket* bucket = findBucket(key)) {
        for (const auto& cell : *bucket) {
            if (const ID3v2Frame* frame = cell.decoded()) {
                result.push_back(frame);
            }
        }
    }
    return result;
}

const ID3v2Frame* ID3v2Tag::get(const std::string& key) const {
    return get(HashKey::fromString(key));
}

const ID3v2Frame* ID3v2Tag::get(const HashKey& key) const {
    auto frames = getall(key);
    return frames.empty() ? nullptr : frames.front();
}

std::vector<const ID3v2Frame*> ID3v2Tag::values() const {
    std::vector<const ID3v2Frame*> result;
    for (const auto& entry : m_frames) {
        for (const auto& cell : entry.second) {
            if (const ID3v2Frame* frame = cell.decoded()) {
                result.push_back(frame);
            }
        }
    }
    return result;
}

void ID3v2Tag::decodeCell(LazyFrame& cell) {
    try {
        if (cell.decode(m_buffer)) {
            ++m_parse_count;
        }
    } catch (const ID3Exception& e) {
        Debug::log("id3", "ID3v2Tag::decodeCell: cannot parse ", cell.frameId(), ": ", e.what());
    }
}

std::vector<const ID3v2Frame*> ID3v2Tag::getallDecoded(const std::string& key) {
    return getallDecoded(HashKey::fromString(key));
}

std::vector<const ID3v2Frame*> ID3v2Tag::getallDecoded(const HashKey& key) {
    if (Bucket* bucket = findBucket(key)) {
        for (auto& cell : *bucket) {
            decodeCell(cell);
        }
    }
    return getall(key);
}

const ID3v2Frame* ID3v2Tag::getDecoded(const std::string& key) {
    return getDecoded(HashKey::fromString(key));
}

const ID3v2Frame* ID3v2Tag::getDecoded(const HashKey& key) {
    auto frames = getallDecoded(key);
    return frames.empty() ? nullptr : frames.front();
}

std::vector<const ID3v2Frame*> ID3v2Tag::valuesDecoded() {
    decodeAll();
    return values();
}

void ID3v2Tag::decodeAll() {
    for (auto& entry : m_frames) {
        for (auto& cell : entry.second) {
            decodeCell(cell);
        }
    }
}

std::vector<std::string> ID3v2Tag::keys() const {
    std::vector<std::string> result;
    result.reserve(m_frames.size());
    for (const auto& entry : m_frames) {
        result.push_back(entry.first.str());
    }
    return result;
}

bool ID3v2Tag::contains(const std::string& key) const {
    return contains(HashKey::fromString(key));
}

bool ID3v2Tag::contains(const HashKey& key) const {
    return findBucket(key) != nullptr;
}

std::string ID3v2Tag::pprint() const {
    std::string out;
    for (const auto& entry : m_frames) {
        for (const auto& cell : entry.second) {
            const ID3v2Frame* frame = cell.decoded();
            if (!frame) {
                continue;
            }
            if (!out.empty()) {
                out += '\n';
            }
            out += entry.first.str();
            out += '=';
            out += frame->pprint();
        }
    }
    return out;
}

// ============================================================================
// ID3v2Tag: reading
// ============================================================================

void ID3v2Tag::readFrames(const uint8_t* data, size_t size, const TagHeader& header) {
    m_major = header.major;
    m_revision = header.revision;
    m_frames.clear();
    m_unknown_frames.clear();
    m_buffer.assign(data, data + size);

    size_t offset = 0;
    if (header.flags.extended && header.major >= 3) {
        if (size < 4) {
            DEBUG_LOG("id3", "truncated extended header");
            return;
        }
        if (header.major == 4) {
            offset = decodeSynchsafeBytes(data);
        } else {
            offset = static_cast<size_t>(decodeBigEndian32(data)) + 4;
        }
        if (offset >= size) {
            DEBUG_LOG("id3", "extended header size ", offset,
                      " exceeds tag body of ", size, " bytes");
            return;
        }
        DEBUG_LOG("id3", "skipped ", offset, " byte extended header");
    }

    if (header.major == 2) {
        readV22Frames(offset);
    } else {
        unsigned bpi = header.major == 4 ? determineBpi(data + offset, size - offset) : 8;
        readV23V24Frames(offset, header.major, bpi);
    }

    DEBUG_LOG("id3", m_frames.size(), " keys, ",
              m_unknown_frames.size(), " unknown frames");
}

void ID3v2Tag::readV22Frames(size_t offset) {
    const uint8_t* data = m_buffer.data();
    const size_t size = m_buffer.size();

    while (offset + TagConstants::ID3V22_FRAME_HEADER_SIZE <= size) {
        if (data[offset] == 0) {
            DEBUG_LOG("id3", "reached padding at offset ", offset);
            break;
        }
        if (!isValidFrameId(data + offset, 3)) {
            Debug::logBytes("id3", "ID3v2Tag::readV22Frames: invalid frame ID at offset " +
                            std::to_string(offset), data + offset, TagConstants::ID3V22_FRAME_HEADER_SIZE);
            break;
        }

        std::string id(reinterpret_cast<const char*>(data + offset), 3);
        uint32_t frame_size = decodeBitPadded(data + offset + 3, 3, 8);
        offset += TagConstants::ID3V22_FRAME_HEADER_SIZE;

        if (frame_size == 0 || frame_size > size - offset) {
            DEBUG_LOG("id3", "bad size ", frame_size, " for ", id);
            break;
        }

        const uint8_t* payload = data + offset;
        offset += frame_size;

        if (id == "PIC") {
            try {
                add(ID3v2Frame::parseV22Picture(payload, frame_size));
            } catch (const ID3Exception& e) {
                DEBUG_LOG("id3", "dropping PIC: ", e.what());
            }
            continue;
        }

        auto mapped = ID3v2Frame::convertV22FrameId(id);
        if (mapped) {
            addRaw(*mapped, std::vector<uint8_t>(payload, payload + frame_size));
        } else {
            DEBUG_LOG("id3", "no v2.3 equivalent for ", id);
            m_unknown_frames.emplace_back(id, std::vector<uint8_t>(payload, payload + frame_size));
        }
    }
}

void ID3v2Tag::readV23V24Frames(size_t offset, uint8_t version, unsigned bpi) {
    const uint8_t* data = m_buffer.data();
    const size_t size = m_buffer.size();

    const uint16_t compressed_flag = version == 4 ? TagConstants::V24_FLAG_COMPRESSION
                                                  : TagConstants::V23_FLAG_COMPRESSION;
    const uint16_t encrypted_flag = version == 4 ? TagConstants::V24_FLAG_ENCRYPTION
                                                 : TagConstants::V23_FLAG_ENCRYPTION;
    const uint16_t unsync_flag = version == 4 ? TagConstants::V24_FLAG_UNSYNCHRONISATION : 0;
    // v2.3 compressed frames carry a 4-byte decompressed size ahead of the data
    const uint16_t length_flag = version == 4 ? TagConstants::V24_FLAG_DATA_LENGTH
                                              : TagConstants::V23_FLAG_COMPRESSION;

    while (offset + TagConstants::ID3V2_FRAME_HEADER_SIZE <= size) {
        if (data[offset] == 0) {
            DEBUG_LOG("id3", "reached padding at offset ", offset);
            break;
        }
        if (!isValidFrameId(data + offset, 4)) {
            Debug::logBytes("id3", "ID3v2Tag::readV23V24Frames: invalid frame ID at offset " +
                            std::to_string(offset), data + offset, TagConstants::ID3V2_FRAME_HEADER_SIZE);
            break;
        }

        std::array<char, 4> raw_id;
        std::memcpy(raw_id.data(), data + offset, 4);
        std::string id(raw_id.data(), raw_id.size());
        uint32_t frame_size = decodeBitPadded(data + offset + 4, 4, bpi);
        uint16_t flags = static_cast<uint16_t>((data[offset + 8] << 8) | data[offset + 9]);
        offset += TagConstants::ID3V2_FRAME_HEADER_SIZE;

        if (frame_size == 0 || frame_size > size - offset) {
            DEBUG_LOG("id3", "bad size ", frame_size, " for ", id);
            break;
        }

        const size_t payload_offset = offset;
        offset += frame_size;

        if ((flags & (compressed_flag | encrypted_flag | unsync_flag | length_flag)) == 0) {
            HashKey key = quickHashKey(id, data + payload_offset, frame_size);
            bucketFor(key).emplace_back(LazyFrame::Slice{raw_id,
                                                         static_cast<uint32_t>(payload_offset),
                                                         frame_size});
            continue;
        }

        std::vector<uint8_t> payload(data + payload_offset, data + payload_offset + frame_size);

        if (flags & encrypted_flag) {
            DEBUG_LOG("id3", id, " is encrypted, kept opaque");
            m_unknown_frames.emplace_back(id, std::move(payload));
            continue;
        }

        if ((flags & length_flag) && payload.size() >= 4) {
            payload.erase(payload.begin(), payload.begin() + 4);
        }

        if (flags & unsync_flag) {
            payload = decodeUnsync(payload.data(), payload.size());
        }

        if (flags & compressed_flag) {
            try {
                Core::Compression::ZlibDecompressor inflater;
                payload = inflater.decompress(payload.data(), payload.size());
            } catch (const Core::DecompressionException& e) {
                Core::ID3BadCompressedDataException bad(e.what());
                DEBUG_LOG("id3", id, ": ", bad.what());
                m_unknown_frames.emplace_back(id, std::vector<uint8_t>(data + payload_offset,
                                                                        data + payload_offset + frame_size));
                continue;
            }
        }

        addRaw(id, std::move(payload));
    }
}

// ============================================================================
// ID3v2Tag: writing
// ============================================================================

std::vector<uint8_t> ID3v2Tag::render(uint8_t version) const {
    std::vector<uint8_t> out;

    for (const auto& entry : m_frames) {
        for (const auto& cell : entry.second) {
            std::string id = cell.frameId();
            std::vector<uint8_t> payload = cell.payload(m_buffer, version);

            if (payload.size() > 0xFFFFFFFFu ||
                (version == 4 && !canEncodeSynchsafe(static_cast<uint32_t>(payload.size())))) {
                throw ID3Exception("Frame " + id + " too large: " + std::to_string(payload.size()) + " bytes");
            }
            uint32_t frame_size = static_cast<uint32_t>(payload.size());

            out.insert(out.end(), id.begin(), id.end());
            if (version == 4) {
                uint8_t size_bytes[4];
                encodeSynchsafeBytes(frame_size, size_bytes);
                out.insert(out.end(), size_bytes, size_bytes + 4);
            } else {
                auto size_bytes = encodeBitPadded(frame_size, 4, 8);
                out.insert(out.end(), size_bytes.begin(), size_bytes.end());
            }
            out.push_back(0);
            out.push_back(0);
            out.insert(out.end(), payload.begin(), payload.end());
        }
    }

    return out;
}

// ============================================================================
// ID3v2Tag: key extraction
// ============================================================================

HashKey ID3v2Tag::quickHashKey(const std::string& id, const uint8_t* data, size_t size) {
    try {
        if (id == "TXXX" || id == "WXXX") {
            if (size == 0) {
                return HashKey(id);
            }
            TextEncoding encoding = encodingFromByte(data[0]);
            return HashKey(id, {readEncodedText(data + 1, size - 1, encoding).first});
        }

        if (id == "COMM" || id == "USLT") {
            if (size < 4) {
                return HashKey(id);
            }
            TextEncoding encoding = encodingFromByte(data[0]);
            std::string lang = Core::Utility::UTF8Util::isValid(data + 1, 3)
                ? std::string(reinterpret_cast<const char*>(data + 1), 3)
                : std::string("XXX");
            std::string desc = readEncodedText(data + 4, size - 4, encoding).first;
            return HashKey(id, {desc, lang});
        }

        if (id == "APIC") {
            if (size == 0) {
                return HashKey(id);
            }
            TextEncoding encoding = encodingFromByte(data[0]);
            size_t pos = 1 + readLatin1Text(data + 1, size - 1).second;
            if (pos >= size) {
                return HashKey(id);
            }
            ++pos; // picture type
            return HashKey(id, {readEncodedText(data + pos, size - pos, encoding).first});
        }

        if (id == "POPM") {
            return HashKey(id, {readLatin1Text(data, size).first});
        }
    } catch (const ID3Exception& e) {
        Debug::log("id3", "ID3v2Tag::quickHashKey: ", id, ": ", e.what());
    }

    return HashKey(id);
}

} // namespace Tag
} // namespace TagSmith
