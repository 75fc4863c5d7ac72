/*
 * ID3v2Frame.h - Typed ID3v2 frames and their binary layouts
 * This file is part of TagSmith.
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGSMITH_TAG_ID3V2FRAME_H
#define TAGSMITH_TAG_ID3V2FRAME_H

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace TagSmith {
namespace Tag {

using ID3v2Utils::TextEncoding;

/**
 * @brief Dictionary key of a tag slot
 *
 * Either a bare frame ID ("TIT2") or a frame ID plus the fields that let
 * the frame repeat: TXXX/WXXX/APIC carry the description, COMM/USLT the
 * description and language, POPM the e-mail. The parts are kept apart so
 * a description containing ':' stays unambiguous.
 */
class HashKey {
public:
    HashKey() = default;
    explicit HashKey(std::string id);
    HashKey(std::string id, std::vector<std::string> parts);

    /**
     * @brief Rebuild a key from its canonical string
     *
     * For COMM and USLT the language is the text after the last ':' and the
     * description everything between the first and the last ':'. Other IDs
     * take everything after the first ':' as one part.
     */
    static HashKey fromString(const std::string& key);

    const std::string& id() const { return m_id; }
    const std::vector<std::string>& parts() const { return m_parts; }
    bool isComposite() const { return !m_parts.empty(); }

    /**
     * @brief Canonical form: ID or ID:part[:part]
     */
    const std::string& str() const { return m_str; }

    bool operator==(const HashKey& other) const;
    bool operator!=(const HashKey& other) const { return !(*this == other); }

private:
    std::string m_id;
    std::vector<std::string> m_parts;
    std::string m_str;
};

/**
 * @brief APIC picture type byte
 */
enum class PictureType : uint8_t {
    Other = 0,
    FileIcon = 1,
    OtherFileIcon = 2,
    CoverFront = 3,
    CoverBack = 4,
    LeafletPage = 5,
    Media = 6,
    LeadArtist = 7,
    Artist = 8,
    Conductor = 9,
    Band = 10,
    Composer = 11,
    Lyricist = 12,
    RecordingLocation = 13,
    DuringRecording = 14,
    DuringPerformance = 15,
    MovieCapture = 16,
    ColouredFish = 17,
    Illustration = 18,
    BandLogo = 19,
    PublisherLogo = 20
};

/**
 * @brief Map a picture type byte, anything above 20 becomes Other
 */
PictureType pictureTypeFromByte(uint8_t b);

// ============================================================================
// Frame shapes
// ============================================================================

/// T*** except TXXX and the paired-text frames
struct TextFrame {
    std::string id;
    TextEncoding encoding = TextEncoding::UTF8;
    std::vector<std::string> text;
};

/// TXXX
struct UserTextFrame {
    std::string id = "TXXX";
    TextEncoding encoding = TextEncoding::UTF8;
    std::string desc;
    std::vector<std::string> text;
};

/// W*** except WXXX. Always Latin-1, no encoding byte.
struct UrlFrame {
    std::string id;
    std::string url;
};

/// WXXX
struct UserUrlFrame {
    std::string id = "WXXX";
    TextEncoding encoding = TextEncoding::UTF8;
    std::string desc;
    std::string url;
};

/// COMM
struct CommentFrame {
    std::string id = "COMM";
    TextEncoding encoding = TextEncoding::UTF8;
    std::string lang = "XXX";
    std::string desc;
    std::string text;
};

/// USLT
struct LyricsFrame {
    std::string id = "USLT";
    TextEncoding encoding = TextEncoding::UTF8;
    std::string lang = "XXX";
    std::string desc;
    std::string text;
};

/// APIC, also built from v2.2 PIC
struct PictureFrame {
    std::string id = "APIC";
    TextEncoding encoding = TextEncoding::UTF8;
    std::string mime;
    PictureType type = PictureType::CoverFront;
    std::string desc;
    std::vector<uint8_t> data;
};

/// POPM
struct PopularimeterFrame {
    std::string id = "POPM";
    std::string email;
    uint8_t rating = 0;
    uint64_t count = 0;
};

/// Any frame the engine does not interpret, kept verbatim
struct BinaryFrame {
    std::string id;
    std::vector<uint8_t> data;
};

/// TIPL, TMCL, IPLS: alternating role/name list
struct PairedTextFrame {
    std::string id;
    TextEncoding encoding = TextEncoding::UTF8;
    std::vector<std::pair<std::string, std::string>> people;
};

/**
 * @brief One decoded ID3v2 frame
 *
 * A tagged union over the ten frame shapes. frameId() and hashKey() are
 * pure functions of the held value.
 */
class ID3v2Frame {
public:
    enum class Type {
        Text = 0,
        UserText,
        Url,
        UserUrl,
        Comment,
        Lyrics,
        Picture,
        Popularimeter,
        Binary,
        PairedText
    };

    using Value = std::variant<TextFrame, UserTextFrame, UrlFrame, UserUrlFrame,
                               CommentFrame, LyricsFrame, PictureFrame,
                               PopularimeterFrame, BinaryFrame, PairedTextFrame>;

    ID3v2Frame(TextFrame frame) : m_value(std::move(frame)) {}
    ID3v2Frame(UserTextFrame frame) : m_value(std::move(frame)) {}
    ID3v2Frame(UrlFrame frame) : m_value(std::move(frame)) {}
    ID3v2Frame(UserUrlFrame frame) : m_value(std::move(frame)) {}
    ID3v2Frame(CommentFrame frame) : m_value(std::move(frame)) {}
    ID3v2Frame(LyricsFrame frame) : m_value(std::move(frame)) {}
    ID3v2Frame(PictureFrame frame) : m_value(std::move(frame)) {}
    ID3v2Frame(PopularimeterFrame frame) : m_value(std::move(frame)) {}
    ID3v2Frame(BinaryFrame frame) : m_value(std::move(frame)) {}
    ID3v2Frame(PairedTextFrame frame) : m_value(std::move(frame)) {}

    Type type() const { return static_cast<Type>(m_value.index()); }
    const Value& value() const { return m_value; }

    template<typename T>
    const T& get() const { return std::get<T>(m_value); }

    template<typename T>
    T& get() { return std::get<T>(m_value); }

    template<typename T>
    const T* getIf() const { return std::get_if<T>(&m_value); }

    /**
     * @brief 4-character frame ID, e.g. "TIT2"
     */
    const std::string& frameId() const;

    /**
     * @brief Key of the slot this frame belongs to
     */
    HashKey hashKey() const;

    /**
     * @brief Human readable one-line rendering
     *
     * Text values are joined with '/', user frames print desc=value,
     * pictures "desc (mime, N bytes)", POPM "email=rating/count", binary
     * frames "[N bytes]" and paired text role=name pairs joined with '/'.
     */
    std::string pprint() const;

    /**
     * @brief Text content for attribute-style access
     *
     * Text frames return their values, comments and lyrics their single
     * text, everything else its pprint().
     */
    std::vector<std::string> textValues() const;

    /**
     * @brief Serialise the frame body (no frame header)
     *
     * For versions below 4 UTF-8 text is written as UTF-16, the only
     * encoding change made on write.
     */
    std::vector<uint8_t> write(uint8_t version) const;

    // ========================================================================
    // Parsing
    // ========================================================================

    /**
     * @brief Parse a frame body by ID
     *
     * TIPL/TMCL/IPLS become paired text, TXXX user text, other T* text,
     * WXXX user URL, other W* URL, COMM/USLT/APIC/POPM their own shapes.
     * Everything else becomes a BinaryFrame.
     *
     * @throws Core::ID3Exception on a malformed body (bad encoding byte,
     *         empty TXXX/WXXX/APIC, COMM/USLT under 4 bytes)
     */
    static ID3v2Frame parse(const std::string& id, const uint8_t* data, size_t size);

    /**
     * @brief Parse a v2.2 PIC body into an APIC PictureFrame
     *
     * PIC stores a 3-character image format instead of a MIME type.
     */
    static ID3v2Frame parseV22Picture(const uint8_t* data, size_t size);

    /**
     * @brief Map a v2.2 3-character ID to its v2.3/v2.4 equivalent
     * @return Empty optional for IDs without an equivalent
     */
    static std::optional<std::string> convertV22FrameId(const std::string& id);

    /**
     * @brief The full v2.2 to v2.3/v2.4 mapping table
     */
    static const std::map<std::string, std::string>& v22FrameIdMap();

private:
    Value m_value;
};

} // namespace Tag
} // namespace TagSmith

#endif // TAGSMITH_TAG_ID3V2FRAME_H
