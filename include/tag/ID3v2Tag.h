/*
 * ID3v2Tag.h - Lazily decoded ID3v2 frame container
 * This file is part of TagSmith.
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGSMITH_TAG_ID3V2TAG_H
#define TAGSMITH_TAG_ID3V2TAG_H

#include <array>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace TagSmith {
namespace Tag {

/**
 * @brief A frame that is parsed on first use
 *
 * Holds one of three states:
 * - Decoded: a parsed ID3v2Frame
 * - Raw: an owned (id, payload) pair, used when flag processing had to
 *   rewrite the payload
 * - Slice: a 4-byte id plus offset/length into the owning container's
 *   buffer, used for the common flag-free frame
 *
 * decode() replaces a Raw or Slice state with Decoded in place. Once
 * decoded, further calls do nothing.
 */
class LazyFrame {
public:
    struct Raw {
        std::string id;
        std::vector<uint8_t> data;
    };

    struct Slice {
        std::array<char, 4> id;
        uint32_t offset;
        uint32_t length;
    };

    explicit LazyFrame(ID3v2Frame frame) : m_state(std::move(frame)) {}
    explicit LazyFrame(Raw raw) : m_state(std::move(raw)) {}
    explicit LazyFrame(Slice slice) : m_state(slice) {}

    bool isDecoded() const { return std::holds_alternative<ID3v2Frame>(m_state); }

    /**
     * @brief The decoded frame, or nullptr while still pending
     */
    const ID3v2Frame* decoded() const { return std::get_if<ID3v2Frame>(&m_state); }

    std::string frameId() const;

    /**
     * @brief Parse a pending cell in place
     *
     * @param buffer The owning container's backing buffer, read by Slice cells
     * @return true if a parse ran, false if the cell was already decoded
     * @throws Core::ID3Exception when the payload is malformed; the cell then
     *         stays pending
     */
    bool decode(const std::vector<uint8_t>& buffer);

    /**
     * @brief Frame body as it would be written for @p version
     *
     * Pending cells return their stored bytes unchanged.
     */
    std::vector<uint8_t> payload(const std::vector<uint8_t>& buffer, uint8_t version) const;

private:
    std::variant<ID3v2Frame, Raw, Slice> m_state;
};

/**
 * @brief Ordered dictionary of ID3v2 frames keyed by HashKey
 *
 * Keys keep first-insertion order and each bucket keeps file order. Frames
 * read from a file stay pending until something asks for them through one
 * of the *Decoded accessors; getall()/get()/values() never parse and only
 * report frames that are already decoded.
 *
 * ## Thread Safety
 *
 * Not thread-safe. Decode-on-demand mutates cells, so a container needs a
 * single owner. Call decodeAll() before sharing one for reading.
 */
class ID3v2Tag {
public:
    using Bucket = std::vector<LazyFrame>;
    using UnknownFrame = std::pair<std::string, std::vector<uint8_t>>;

    ID3v2Tag() = default;
    ~ID3v2Tag() = default;

    ID3v2Tag(const ID3v2Tag&) = default;
    ID3v2Tag& operator=(const ID3v2Tag&) = default;
    ID3v2Tag(ID3v2Tag&&) = default;
    ID3v2Tag& operator=(ID3v2Tag&&) = default;

    // ========================================================================
    // Mutation
    // ========================================================================

    /**
     * @brief Append a decoded frame to the bucket of its hashKey()
     */
    void add(ID3v2Frame frame);

    /**
     * @brief Append a pending frame; the key comes from quickHashKey()
     */
    void addRaw(std::string id, std::vector<uint8_t> data);

    /**
     * @brief Replace a bucket wholesale. An empty list removes the key.
     *
     * The bucket is stored under @p key as given. A frame whose own
     * hashKey() differs is logged on the id3 channel; a later add() of the
     * same frame goes to a second bucket.
     */
    void setall(const std::string& key, std::vector<ID3v2Frame> frames);
    void setall(const HashKey& key, std::vector<ID3v2Frame> frames);

    void delall(const std::string& key);
    void delall(const HashKey& key);

    /**
     * @brief Replace the bucket for @p id with one UTF-8 text frame
     */
    void setText(const std::string& id, std::vector<std::string> values);

    // ========================================================================
    // Read-only lookup (decoded frames only)
    // ========================================================================

    std::vector<const ID3v2Frame*> getall(const std::string& key) const;
    std::vector<const ID3v2Frame*> getall(const HashKey& key) const;

    /**
     * @brief First decoded frame of a bucket, or nullptr
     */
    const ID3v2Frame* get(const std::string& key) const;
    const ID3v2Frame* get(const HashKey& key) const;

    std::vector<const ID3v2Frame*> values() const;

    // ========================================================================
    // Decoding lookup
    // ========================================================================

    /**
     * @brief Decode the bucket, then return its decoded frames
     *
     * Cells that fail to parse are logged on the "id3" channel and left
     * pending, so they are skipped here but still written back by render().
     */
    std::vector<const ID3v2Frame*> getallDecoded(const std::string& key);
    std::vector<const ID3v2Frame*> getallDecoded(const HashKey& key);

    const ID3v2Frame* getDecoded(const std::string& key);
    const ID3v2Frame* getDecoded(const HashKey& key);

    std::vector<const ID3v2Frame*> valuesDecoded();
    void decodeAll();

    // ========================================================================
    // Introspection
    // ========================================================================

    std::vector<std::string> keys() const;
    size_t size() const { return m_frames.size(); }
    bool empty() const { return m_frames.empty(); }
    bool contains(const std::string& key) const;
    bool contains(const HashKey& key) const;

    /**
     * @brief One "KEY=pprint" line per decoded frame
     */
    std::string pprint() const;

    uint8_t majorVersion() const { return m_major; }
    uint8_t revision() const { return m_revision; }
    void setVersion(uint8_t major, uint8_t revision) { m_major = major; m_revision = revision; }

    /**
     * @brief Payloads the engine could not interpret (encrypted, failed to
     *        inflate, unmapped v2.2 IDs). Not reachable by key.
     */
    const std::vector<UnknownFrame>& unknownFrames() const { return m_unknown_frames; }

    /**
     * @brief Number of lazy cells parsed so far by this container
     */
    size_t parseCount() const { return m_parse_count; }

    // ========================================================================
    // Serialisation
    // ========================================================================

    /**
     * @brief Populate the container from a tag body
     *
     * @param data Tag body following the 10-byte header, already freed of
     *        whole-tag unsynchronisation
     * @param size Size of @p data
     * @param header The tag's header
     *
     * The walk ends quietly at padding or at the first frame header that
     * does not make sense; per-frame failures land in unknownFrames().
     * Frames already held are discarded first.
     */
    void readFrames(const uint8_t* data, size_t size, const TagHeader& header);

    /**
     * @brief Serialise every frame as ID, size, zero flags, body
     *
     * Sizes are syncsafe for @p version 4 and plain big-endian otherwise.
     * Pending cells are passed through without being parsed.
     */
    std::vector<uint8_t> render(uint8_t version) const;

    /**
     * @brief Compute a frame's key from its raw body without a full parse
     *
     * Reads only the description, language or e-mail fields. Falls back to
     * the bare ID when those fields are malformed; never throws.
     */
    static HashKey quickHashKey(const std::string& id, const uint8_t* data, size_t size);

private:
    Bucket* findBucket(const HashKey& key);
    const Bucket* findBucket(const HashKey& key) const;
    Bucket& bucketFor(const HashKey& key);

    void decodeCell(LazyFrame& cell);
    void readV22Frames(size_t offset);
    void readV23V24Frames(size_t offset, uint8_t version, unsigned bpi);

    std::vector<std::pair<HashKey, Bucket>> m_frames;
    uint8_t m_major = 4;
    uint8_t m_revision = 0;
    std::vector<UnknownFrame> m_unknown_frames;
    std::vector<uint8_t> m_buffer;      ///< Tag body, backs every Slice cell
    size_t m_parse_count = 0;
};

} // namespace Tag
} // namespace TagSmith

#endif // TAGSMITH_TAG_ID3V2TAG_H
