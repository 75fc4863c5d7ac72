/*
 * ID3v2Frame.cpp - Typed ID3v2 frames and their binary layouts
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
// HashKey
// ============================================================================

HashKey::HashKey(std::string id) : m_id(std::move(id)), m_str(m_id) {
}

HashKey::HashKey(std::string id, std::vector<std::string> parts)
    : m_id(std::move(id)), m_parts(std::move(parts)), m_str(m_id) {
    for (const auto& part : m_parts) {
        m_str += ':';
        m_str += part;
    }
}

HashKey HashKey::fromString(const std::string& key) {
    size_t first = key.find(':');
    if (first == std::string::npos) {
        return HashKey(key);
    }

    std::string id = key.substr(0, first);
    if (id == "COMM" || id == "USLT") {
        size_t last = key.rfind(':');
        if (last > first) {
            return HashKey(id, {key.substr(first + 1, last - first - 1), key.substr(last + 1)});
        }
    }
    return HashKey(id, {key.substr(first + 1)});
}

bool HashKey::operator==(const HashKey& other) const {
    return m_id == other.m_id && m_parts == other.m_parts;
}

PictureType pictureTypeFromByte(uint8_t b) {
    if (b > static_cast<uint8_t>(PictureType::PublisherLogo)) {
        return PictureType::Other;
    }
    return static_cast<PictureType>(b);
}

namespace {

std::string joinValues(const std::vector<std::string>& values, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += separator;
        }
        out += values[i];
    }
    return out;
}

std::string trimTrailingNuls(std::string text) {
    size_t end = text.find_last_not_of('\0');
    text.erase(end == std::string::npos ? 0 : end + 1);
    return text;
}

// 3-byte language code, "XXX" when the bytes are not valid UTF-8
std::string readLanguage(const uint8_t* data) {
    if (!Core::Utility::UTF8Util::isValid(data, 3)) {
        return "XXX";
    }
    return std::string(reinterpret_cast<const char*>(data), 3);
}

// UTF-8 is only legal from v2.4 on
TextEncoding encodingForVersion(TextEncoding encoding, uint8_t version) {
    if (version < 4 && encoding == TextEncoding::UTF8) {
        return TextEncoding::UTF16;
    }
    return encoding;
}

void append(std::vector<uint8_t>& out, const std::vector<uint8_t>& bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

void appendTerminator(std::vector<uint8_t>& out, TextEncoding encoding) {
    out.insert(out.end(), nullTerminatorSize(encoding), 0);
}

void appendLanguage(std::vector<uint8_t>& out, const std::string& lang) {
    if (lang.size() >= 3) {
        out.insert(out.end(), lang.begin(), lang.begin() + 3);
    } else {
        out.insert(out.end(), {'X', 'X', 'X'});
    }
}

// ----------------------------------------------------------------------------
// Per-shape parsers
// ----------------------------------------------------------------------------

ID3v2Frame parseText(const std::string& id, const uint8_t* data, size_t size) {
    TextFrame frame;
    frame.id = id;
    if (size == 0) {
        frame.encoding = TextEncoding::Latin1;
        return frame;
    }
    frame.encoding = encodingFromByte(data[0]);
    frame.text = splitText(decodeText(data + 1, size - 1, frame.encoding));
    return frame;
}

ID3v2Frame parseUserText(const std::string& id, const uint8_t* data, size_t size) {
    if (size == 0) {
        throw ID3Exception("Empty TXXX frame");
    }
    UserTextFrame frame;
    frame.id = id;
    frame.encoding = encodingFromByte(data[0]);
    auto desc = readEncodedText(data + 1, size - 1, frame.encoding);
    frame.desc = desc.first;
    size_t consumed = 1 + desc.second;
    frame.text = splitText(decodeText(data + consumed, size - consumed, frame.encoding));
    return frame;
}

ID3v2Frame parseUrl(const std::string& id, const uint8_t* data, size_t size) {
    UrlFrame frame;
    frame.id = id;
    frame.url = trimTrailingNuls(decodeText(data, size, TextEncoding::Latin1));
    return frame;
}

ID3v2Frame parseUserUrl(const std::string& id, const uint8_t* data, size_t size) {
    if (size == 0) {
        throw ID3Exception("Empty WXXX frame");
    }
    UserUrlFrame frame;
    frame.id = id;
    frame.encoding = encodingFromByte(data[0]);
    auto desc = readEncodedText(data + 1, size - 1, frame.encoding);
    frame.desc = desc.first;
    size_t consumed = 1 + desc.second;
    frame.url = trimTrailingNuls(decodeText(data + consumed, size - consumed, TextEncoding::Latin1));
    return frame;
}

// COMM and USLT share one layout
template<typename T>
T parseLanguageText(const std::string& id, const uint8_t* data, size_t size) {
    if (size < 4) {
        throw ID3Exception(id + " frame too short");
    }
    T frame;
    frame.id = id;
    frame.encoding = encodingFromByte(data[0]);
    frame.lang = readLanguage(data + 1);
    auto desc = readEncodedText(data + 4, size - 4, frame.encoding);
    frame.desc = desc.first;
    size_t consumed = 4 + desc.second;
    frame.text = trimTrailingNuls(decodeText(data + consumed, size - consumed, frame.encoding));
    return frame;
}

ID3v2Frame parsePicture(const std::string& id, const uint8_t* data, size_t size) {
    if (size == 0) {
        throw ID3Exception("Empty APIC frame");
    }
    PictureFrame frame;
    frame.id = id;
    frame.encoding = encodingFromByte(data[0]);

    auto mime = readLatin1Text(data + 1, size - 1);
    frame.mime = mime.first;
    size_t pos = 1 + mime.second;
    if (pos >= size) {
        throw ID3Exception("APIC frame too short");
    }

    frame.type = pictureTypeFromByte(data[pos++]);

    auto desc = readEncodedText(data + pos, size - pos, frame.encoding);
    frame.desc = desc.first;
    pos += desc.second;
    frame.data.assign(data + pos, data + size);
    return frame;
}

ID3v2Frame parsePopularimeter(const std::string& id, const uint8_t* data, size_t size) {
    PopularimeterFrame frame;
    frame.id = id;
    auto email = readLatin1Text(data, size);
    frame.email = email.first;
    size_t pos = email.second;

    if (pos < size) {
        frame.rating = data[pos++];
    }
    // Variable-length big-endian play counter
    for (; pos < size; ++pos) {
        frame.count = (frame.count << 8) | data[pos];
    }
    return frame;
}

ID3v2Frame parsePairedText(const std::string& id, const uint8_t* data, size_t size) {
    PairedTextFrame frame;
    frame.id = id;
    if (size == 0) {
        frame.encoding = TextEncoding::Latin1;
        return frame;
    }
    frame.encoding = encodingFromByte(data[0]);
    std::string text = decodeText(data + 1, size - 1, frame.encoding);

    // Empty items are kept here so roles and names stay aligned
    std::vector<std::string> items;
    size_t start = 0;
    while (true) {
        size_t end = text.find('\0', start);
        if (end == std::string::npos) {
            items.emplace_back(text, start);
            break;
        }
        items.emplace_back(text, start, end - start);
        start = end + 1;
    }

    for (size_t i = 0; i + 1 < items.size(); i += 2) {
        frame.people.emplace_back(items[i], items[i + 1]);
    }
    return frame;
}

} // anonymous namespace

// ============================================================================
// ID3v2Frame
// ============================================================================

const std::string& ID3v2Frame::frameId() const {
    return std::visit([](const auto& frame) -> const std::string& { return frame.id; }, m_value);
}

HashKey ID3v2Frame::hashKey() const {
    switch (type()) {
        case Type::UserText:
            return HashKey("TXXX", {get<UserTextFrame>().desc});
        case Type::UserUrl:
            return HashKey("WXXX", {get<UserUrlFrame>().desc});
        case Type::Comment: {
            const auto& f = get<CommentFrame>();
            return HashKey("COMM", {f.desc, f.lang});
        }
        case Type::Lyrics: {
            const auto& f = get<LyricsFrame>();
            return HashKey("USLT", {f.desc, f.lang});
        }
        case Type::Picture:
            return HashKey("APIC", {get<PictureFrame>().desc});
        case Type::Popularimeter:
            return HashKey("POPM", {get<PopularimeterFrame>().email});
        default:
            return HashKey(frameId());
    }
}

std::string ID3v2Frame::pprint() const {
    switch (type()) {
        case Type::Text:
            return joinValues(get<TextFrame>().text, "/");
        case Type::UserText: {
            const auto& f = get<UserTextFrame>();
            return f.desc + "=" + joinValues(f.text, "/");
        }
        case Type::Url:
            return get<UrlFrame>().url;
        case Type::UserUrl: {
            const auto& f = get<UserUrlFrame>();
            return f.desc + "=" + f.url;
        }
        case Type::Comment:
            return get<CommentFrame>().text;
        case Type::Lyrics:
            return get<LyricsFrame>().text;
        case Type::Picture: {
            const auto& f = get<PictureFrame>();
            return f.desc + " (" + f.mime + ", " + std::to_string(f.data.size()) + " bytes)";
        }
        case Type::Popularimeter: {
            const auto& f = get<PopularimeterFrame>();
            return f.email + "=" + std::to_string(f.rating) + "/" + std::to_string(f.count);
        }
        case Type::Binary:
            return "[" + std::to_string(get<BinaryFrame>().data.size()) + " bytes]";
        case Type::PairedText: {
            std::vector<std::string> pairs;
            for (const auto& person : get<PairedTextFrame>().people) {
                pairs.push_back(person.first + "=" + person.second);
            }
            return joinValues(pairs, "/");
        }
    }
    return "";
}

std::vector<std::string> ID3v2Frame::textValues() const {
    switch (type()) {
        case Type::Text:
            return get<TextFrame>().text;
        case Type::UserText:
            return get<UserTextFrame>().text;
        case Type::Comment:
            return {get<CommentFrame>().text};
        case Type::Lyrics:
            return {get<LyricsFrame>().text};
        default:
            return {pprint()};
    }
}

std::vector<uint8_t> ID3v2Frame::write(uint8_t version) const {
    std::vector<uint8_t> out;

    switch (type()) {
        case Type::Text: {
            const auto& f = get<TextFrame>();
            TextEncoding enc = encodingForVersion(f.encoding, version);
            out.push_back(static_cast<uint8_t>(enc));
            append(out, encodeText(joinValues(f.text, std::string(1, '\0')), enc));
            break;
        }
        case Type::UserText: {
            const auto& f = get<UserTextFrame>();
            TextEncoding enc = encodingForVersion(f.encoding, version);
            out.push_back(static_cast<uint8_t>(enc));
            append(out, encodeText(f.desc, enc));
            appendTerminator(out, enc);
            append(out, encodeText(joinValues(f.text, std::string(1, '\0')), enc));
            break;
        }
        case Type::Url:
            append(out, encodeText(get<UrlFrame>().url, TextEncoding::Latin1));
            break;
        case Type::UserUrl: {
            const auto& f = get<UserUrlFrame>();
            TextEncoding enc = encodingForVersion(f.encoding, version);
            out.push_back(static_cast<uint8_t>(enc));
            append(out, encodeText(f.desc, enc));
            appendTerminator(out, enc);
            append(out, encodeText(f.url, TextEncoding::Latin1));
            break;
        }
        case Type::Comment:
        case Type::Lyrics: {
            const auto* c = getIf<CommentFrame>();
            const auto* l = getIf<LyricsFrame>();
            TextEncoding enc = encodingForVersion(c ? c->encoding : l->encoding, version);
            out.push_back(static_cast<uint8_t>(enc));
            appendLanguage(out, c ? c->lang : l->lang);
            append(out, encodeText(c ? c->desc : l->desc, enc));
            appendTerminator(out, enc);
            append(out, encodeText(c ? c->text : l->text, enc));
            break;
        }
        case Type::Picture: {
            const auto& f = get<PictureFrame>();
            TextEncoding enc = encodingForVersion(f.encoding, version);
            out.push_back(static_cast<uint8_t>(enc));
            append(out, encodeText(f.mime, TextEncoding::Latin1));
            out.push_back(0);
            out.push_back(static_cast<uint8_t>(f.type));
            append(out, encodeText(f.desc, enc));
            appendTerminator(out, enc);
            append(out, f.data);
            break;
        }
        case Type::Popularimeter: {
            const auto& f = get<PopularimeterFrame>();
            append(out, encodeText(f.email, TextEncoding::Latin1));
            out.push_back(0);
            out.push_back(f.rating);
            // Minimal big-endian counter, omitted entirely when zero
            std::vector<uint8_t> count;
            for (uint64_t c = f.count; c > 0; c >>= 8) {
                count.insert(count.begin(), static_cast<uint8_t>(c & 0xFF));
            }
            append(out, count);
            break;
        }
        case Type::Binary:
            out = get<BinaryFrame>().data;
            break;
        case Type::PairedText: {
            const auto& f = get<PairedTextFrame>();
            TextEncoding enc = encodingForVersion(f.encoding, version);
            out.push_back(static_cast<uint8_t>(enc));
            std::vector<std::string> items;
            for (const auto& person : f.people) {
                items.push_back(person.first);
                items.push_back(person.second);
            }
            append(out, encodeText(joinValues(items, std::string(1, '\0')), enc));
            break;
        }
    }

    return out;
}

ID3v2Frame ID3v2Frame::parse(const std::string& id, const uint8_t* data, size_t size) {
    if (id == "TIPL" || id == "TMCL" || id == "IPLS") {
        return parsePairedText(id, data, size);
    }
    if (id == "TXXX") {
        return parseUserText(id, data, size);
    }
    if (!id.empty() && id[0] == 'T') {
        return parseText(id, data, size);
    }
    if (id == "WXXX") {
        return parseUserUrl(id, data, size);
    }
    if (!id.empty() && id[0] == 'W') {
        return parseUrl(id, data, size);
    }
    if (id == "COMM") {
        return parseLanguageText<CommentFrame>(id, data, size);
    }
    if (id == "USLT") {
        return parseLanguageText<LyricsFrame>(id, data, size);
    }
    if (id == "APIC") {
        return parsePicture(id, data, size);
    }
    if (id == "POPM") {
        return parsePopularimeter(id, data, size);
    }

    BinaryFrame frame;
    frame.id = id;
    frame.data.assign(data, data + size);
    return frame;
}

ID3v2Frame ID3v2Frame::parseV22Picture(const uint8_t* data, size_t size) {
    if (size < 5) {
        throw ID3Exception("PIC frame too short");
    }

    PictureFrame frame;
    frame.encoding = encodingFromByte(data[0]);

    std::string format = Core::Utility::UTF8Util::isValid(data + 1, 3)
        ? std::string(reinterpret_cast<const char*>(data + 1), 3)
        : std::string("JPG");
    std::string upper = format;
    std::string lower = format;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (upper == "JPG") {
        frame.mime = "image/jpeg";
    } else if (upper == "PNG") {
        frame.mime = "image/png";
    } else {
        frame.mime = "image/" + lower;
    }

    frame.type = pictureTypeFromByte(data[4]);

    auto desc = readEncodedText(data + 5, size - 5, frame.encoding);
    frame.desc = desc.first;
    frame.data.assign(data + 5 + desc.second, data + size);
    return frame;
}

const std::map<std::string, std::string>& ID3v2Frame::v22FrameIdMap() {
    static const std::map<std::string, std::string> v22_to_v24_map = {
        // Text frames
        {"TT1", "TIT1"},  // Content group description
        {"TT2", "TIT2"},  // Title
        {"TT3", "TIT3"},  // Subtitle
        {"TP1", "TPE1"},  // Artist
        {"TP2", "TPE2"},  // Album artist
        {"TP3", "TPE3"},  // Conductor
        {"TP4", "TPE4"},  // Interpreted/remixed by
        {"TCM", "TCOM"},  // Composer
        {"TXT", "TEXT"},  // Lyricist
        {"TLA", "TLAN"},  // Language
        {"TCO", "TCON"},  // Genre
        {"TAL", "TALB"},  // Album
        {"TPA", "TPOS"},  // Part of set
        {"TRK", "TRCK"},  // Track number
        {"TRC", "TSRC"},  // ISRC
        {"TYE", "TYER"},  // Year
        {"TDA", "TDAT"},  // Date
        {"TIM", "TIME"},  // Time
        {"TRD", "TRDA"},  // Recording dates
        {"TMT", "TMED"},  // Media type
        {"TFT", "TFLT"},  // File type
        {"TBP", "TBPM"},  // BPM
        {"TCR", "TCOP"},  // Copyright
        {"TPB", "TPUB"},  // Publisher
        {"TEN", "TENC"},  // Encoded by
        {"TSS", "TSSE"},  // Encoder settings
        {"TOF", "TOFN"},  // Original filename
        {"TLE", "TLEN"},  // Length
        {"TSI", "TSIZ"},  // Size
        {"TDY", "TDLY"},  // Playlist delay
        {"TKE", "TKEY"},  // Initial key
        {"TOT", "TOAL"},  // Original album
        {"TOA", "TOPE"},  // Original artist
        {"TOL", "TOLY"},  // Original lyricist
        {"TOR", "TORY"},  // Original release year
        {"TXX", "TXXX"},  // User text

        // URL frames
        {"WAF", "WOAF"},
        {"WAR", "WOAR"},
        {"WAS", "WOAS"},
        {"WCM", "WCOM"},
        {"WCP", "WCOP"},
        {"WPB", "WPUB"},
        {"WXX", "WXXX"},

        {"COM", "COMM"},
        {"ULT", "USLT"},
        {"PIC", "APIC"},

        // Other frames
        {"CNT", "PCNT"},  // Play counter
        {"POP", "POPM"},  // Popularimeter
        {"BUF", "RBUF"},  // Recommended buffer size
        {"CRA", "AENC"},  // Audio encryption
        {"ETC", "ETCO"},  // Event timing codes
        {"EQU", "EQUA"},  // Equalization
        {"IPL", "IPLS"},  // Involved people list
        {"LNK", "LINK"},  // Linked information
        {"MCI", "MCDI"},  // Music CD identifier
        {"MLL", "MLLT"},  // MPEG location lookup table
        {"REV", "RVRB"},  // Reverb
        {"SLT", "SYLT"},  // Synchronized lyrics
        {"STC", "SYTC"},  // Synchronized tempo codes
        {"UFI", "UFID"},  // Unique file identifier
        {"GEO", "GEOB"},  // General encapsulated object
    };
    return v22_to_v24_map;
}

std::optional<std::string> ID3v2Frame::convertV22FrameId(const std::string& id) {
    const auto& map = v22FrameIdMap();
    auto it = map.find(id);
    if (it != map.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace Tag
} // namespace TagSmith
