/*
 * ID3v1Tag.cpp - ID3v1/ID3v1.1 legacy tag codec
 * This file is part of TagSmith.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tagsmith.h"

namespace TagSmith {
namespace Tag {

using Core::Utility::UTF8Util;

// ============================================================================
// ID3v1 Genre List (Standard 80 + Winamp Extensions up to 191)
// ============================================================================

static const std::array<std::string, ID3v1Tag::GENRE_COUNT> s_genre_list = {{
    // Standard ID3v1 genres (0-79)
    "Blues",                  // 0
    "Classic Rock",           // 1
    "Country",                // 2
    "Dance",                  // 3
    "Disco",                  // 4
    "Funk",                   // 5
    "Grunge",                 // 6
    "Hip-Hop",                // 7
    "Jazz",                   // 8
    "Metal",                  // 9
    "New Age",                // 10
    "Oldies",                 // 11
    "Other",                  // 12
    "Pop",                    // 13
    "R&B",                    // 14
    "Rap",                    // 15
    "Reggae",                 // 16
    "Rock",                   // 17
    "Techno",                 // 18
    "Industrial",             // 19
    "Alternative",            // 20
    "Ska",                    // 21
    "Death Metal",            // 22
    "Pranks",                 // 23
    "Soundtrack",             // 24
    "Euro-Techno",            // 25
    "Ambient",                // 26
    "Trip-Hop",               // 27
    "Vocal",                  // 28
    "Jazz+Funk",              // 29
    "Fusion",                 // 30
    "Trance",                 // 31
    "Classical",              // 32
    "Instrumental",           // 33
    "Acid",                   // 34
    "House",                  // 35
    "Game",                   // 36
    "Sound Clip",             // 37
    "Gospel",                 // 38
    "Noise",                  // 39
    "AlternRock",             // 40
    "Bass",                   // 41
    "Soul",                   // 42
    "Punk",                   // 43
    "Space",                  // 44
    "Meditative",             // 45
    "Instrumental Pop",       // 46
    "Instrumental Rock",      // 47
    "Ethnic",                 // 48
    "Gothic",                 // 49
    "Darkwave",               // 50
    "Techno-Industrial",      // 51
    "Electronic",             // 52
    "Pop-Folk",               // 53
    "Eurodance",              // 54
    "Dream",                  // 55
    "Southern Rock",          // 56
    "Comedy",                 // 57
    "Cult",                   // 58
    "Gangsta",                // 59
    "Top 40",                 // 60
    "Christian Rap",          // 61
    "Pop/Funk",               // 62
    "Jungle",                 // 63
    "Native American",        // 64
    "Cabaret",                // 65
    "New Wave",               // 66
    "Psychedelic",            // 67
    "Rave",                   // 68
    "Showtunes",              // 69
    "Trailer",                // 70
    "Lo-Fi",                  // 71
    "Tribal",                 // 72
    "Acid Punk",              // 73
    "Acid Jazz",              // 74
    "Polka",                  // 75
    "Retro",                  // 76
    "Musical",                // 77
    "Rock & Roll",            // 78
    "Hard Rock",              // 79
    
    // Winamp extensions (80-191)
    "Folk",                   // 80
    "Folk-Rock",              // 81
    "National Folk",          // 82
    "Swing",                  // 83
    "Fast Fusion",            // 84
    "Bebop",                  // 85
    "Latin",                  // 86
    "Revival",                // 87
    "Celtic",                 // 88
    "Bluegrass",              // 89
    "Avantgarde",             // 90
    "Gothic Rock",            // 91
    "Progressive Rock",       // 92
    "Psychedelic Rock",       // 93
    "Symphonic Rock",         // 94
    "Slow Rock",              // 95
    "Big Band",               // 96
    "Chorus",                 // 97
    "Easy Listening",         // 98
    "Acoustic",               // 99
    "Humour",                 // 100
    "Speech",                 // 101
    "Chanson",                // 102
    "Opera",                  // 103
    "Chamber Music",          // 104
    "Sonata",                 // 105
    "Symphony",               // 106
    "Booty Bass",             // 107
    "Primus",                 // 108
    "Porn Groove",            // 109
    "Satire",                 // 110
    "Slow Jam",               // 111
    "Club",                   // 112
    "Tango",                  // 113
    "Samba",                  // 114
    "Folklore",               // 115
    "Ballad",                 // 116
    "Power Ballad",           // 117
    "Rhythmic Soul",          // 118
    "Freestyle",              // 119
    "Duet",                   // 120
    "Punk Rock",              // 121
    "Drum Solo",              // 122
    "A Cappella",             // 123
    "Euro-House",             // 124
    "Dance Hall",             // 125
    "Goa",                    // 126
    "Drum & Bass",            // 127
    "Club-House",             // 128
    "Hardcore Techno",        // 129
    "Terror",                 // 130
    "Indie",                  // 131
    "BritPop",                // 132
    "Negerpunk",              // 133
    "Polsk Punk",             // 134
    "Beat",                   // 135
    "Christian Gangsta Rap",  // 136
    "Heavy Metal",            // 137
    "Black Metal",            // 138
    "Crossover",              // 139
    "Contemporary Christian", // 140
    "Christian Rock",         // 141
    "Merengue",               // 142
    "Salsa",                  // 143
    "Thrash Metal",           // 144
    "Anime",                  // 145
    "JPop",                   // 146
    "Synthpop",               // 147
    "Abstract",               // 148
    "Art Rock",               // 149
    "Baroque",                // 150
    "Bhangra",                // 151
    "Big Beat",               // 152
    "Breakbeat",              // 153
    "Chillout",               // 154
    "Downtempo",              // 155
    "Dub",                    // 156
    "EBM",                    // 157
    "Eclectic",               // 158
    "Electro",                // 159
    "Electroclash",           // 160
    "Emo",                    // 161
    "Experimental",           // 162
    "Garage",                 // 163
    "Global",                 // 164
    "IDM",                    // 165
    "Illbient",               // 166
    "Industro-Goth",          // 167
    "Jam Band",               // 168
    "Krautrock",              // 169
    "Leftfield",              // 170
    "Lounge",                 // 171
    "Math Rock",              // 172
    "New Romantic",           // 173
    "Nu-Breakz",              // 174
    "Post-Punk",              // 175
    "Post-Rock",              // 176
    "Psytrance",              // 177
    "Shoegaze",               // 178
    "Space Rock",             // 179
    "Trop Rock",              // 180
    "World Music",            // 181
    "Neoclassical",           // 182
    "Audiobook",              // 183
    "Audio Theatre",          // 184
    "Neue Deutsche Welle",    // 185
    "Podcast",                // 186
    "Indie Rock",             // 187
    "G-Funk",                 // 188
    "Dubstep",                // 189
    "Garage Rock",            // 190
    "Psybient"                // 191
}};

namespace {

// Fixed field offsets within the 128-byte block
constexpr size_t TITLE_OFFSET = 3;
constexpr size_t ARTIST_OFFSET = 33;
constexpr size_t ALBUM_OFFSET = 63;
constexpr size_t YEAR_OFFSET = 93;
constexpr size_t COMMENT_OFFSET = 97;
constexpr size_t TRACK_MARKER_OFFSET = 125;
constexpr size_t TRACK_OFFSET = 126;
constexpr size_t GENRE_OFFSET = 127;

ID3v2Frame latin1Text(const std::string& id, const std::string& value) {
    TextFrame frame;
    frame.id = id;
    frame.encoding = TextEncoding::Latin1;
    frame.text.push_back(value);
    return frame;
}

std::string trimWhitespace(const std::string& text) {
    const char* ws = " \t\r\n";
    size_t begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

// Non-negative decimal integer, nothing else allowed
std::optional<unsigned long> parseIndex(const std::string& text) {
    if (text.empty() || text.size() > 9) {
        return std::nullopt;
    }
    unsigned long value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
    }
    return value;
}

std::string genreOrText(const std::string& text) {
    auto index = parseIndex(text);
    if (index && *index < ID3v1Tag::GENRE_COUNT) {
        return ID3v1Tag::genreList()[*index];
    }
    return text;
}

const std::string* firstText(const ID3v2Frame& frame) {
    const auto* text = frame.getIf<TextFrame>();
    if (!text || text->text.empty()) {
        return nullptr;
    }
    return &text->text.front();
}

} // anonymous namespace

// ============================================================================
// Static Methods
// ============================================================================

const std::array<std::string, ID3v1Tag::GENRE_COUNT>& ID3v1Tag::genreList() {
    return s_genre_list;
}

std::string ID3v1Tag::genreFromIndex(uint8_t index) {
    if (index < GENRE_COUNT) {
        return s_genre_list[index];
    }
    return ""; // Unknown genre (255 or out of range)
}

std::optional<uint8_t> ID3v1Tag::genreIndex(const std::string& name) {
    for (size_t i = 0; i < GENRE_COUNT; ++i) {
        if (s_genre_list[i] == name) {
            return static_cast<uint8_t>(i);
        }
    }
    return std::nullopt;
}

bool ID3v1Tag::isValid(const uint8_t* data, size_t size) {
    if (!data || size < TAG_SIZE) {
        return false;
    }
    return data[0] == 'T' && data[1] == 'A' && data[2] == 'G';
}

std::optional<size_t> ID3v1Tag::findID3v1(const uint8_t* data, size_t size) {
    if (!data || size < TAG_SIZE) {
        return std::nullopt;
    }
    size_t offset = size - TAG_SIZE;
    if (!isValid(data + offset, TAG_SIZE)) {
        return std::nullopt;
    }
    return offset;
}

std::string ID3v1Tag::trimString(const uint8_t* data, size_t max_len) {
    size_t len = 0;
    while (len < max_len && data[len] != '\0') {
        len++;
    }

    while (len > 0 && std::isspace(data[len - 1])) {
        len--;
    }

    return UTF8Util::fromLatin1(data, len);
}

void ID3v1Tag::writeString(uint8_t* dest, size_t width, const std::string& text) {
    auto latin1 = UTF8Util::toLatin1(text);
    std::memcpy(dest, latin1.data(), std::min(width, latin1.size()));
}

std::vector<ID3v2Frame> ID3v1Tag::parse(const uint8_t* data, size_t size) {
    std::vector<ID3v2Frame> frames;
    if (!data || size < TAG_SIZE) {
        return frames;
    }

    const uint8_t* block = data + (size - TAG_SIZE);
    if (!isValid(block, TAG_SIZE)) {
        Debug::log("id3v1", "ID3v1Tag::parse: missing TAG header");
        return frames;
    }

    auto addField = [&](const char* id, size_t offset, size_t width) {
        std::string value = trimString(block + offset, width);
        if (!value.empty()) {
            frames.push_back(latin1Text(id, value));
        }
    };

    addField("TIT2", TITLE_OFFSET, 30);
    addField("TPE1", ARTIST_OFFSET, 30);
    addField("TALB", ALBUM_OFFSET, 30);
    addField("TDRC", YEAR_OFFSET, 4);

    // ID3v1.1: byte 125 is 0x00 and byte 126 is the track number
    bool v1_1 = block[TRACK_MARKER_OFFSET] == 0x00 && block[TRACK_OFFSET] != 0x00;
    std::string comment = trimString(block + COMMENT_OFFSET, v1_1 ? 28 : 30);
    if (!comment.empty()) {
        CommentFrame frame;
        frame.encoding = TextEncoding::Latin1;
        frame.lang = "XXX";
        frame.text = comment;
        frames.emplace_back(std::move(frame));
    }
    if (v1_1) {
        frames.push_back(latin1Text("TRCK", std::to_string(block[TRACK_OFFSET])));
    }

    uint8_t genre = block[GENRE_OFFSET];
    if (genre < GENRE_COUNT) {
        frames.push_back(latin1Text("TCON", s_genre_list[genre]));
    }

    Debug::log("id3v1", "ID3v1Tag::parse: ", frames.size(), " fields, v1.1=", v1_1,
               ", genre=", static_cast<int>(genre));

    return frames;
}

std::vector<uint8_t> ID3v1Tag::make(const std::vector<const ID3v2Frame*>& frames) {
    std::vector<uint8_t> block(TAG_SIZE, 0);
    block[0] = 'T';
    block[1] = 'A';
    block[2] = 'G';
    block[GENRE_OFFSET] = GENRE_NONE;

    bool has_track = false;
    std::string comment;

    for (const ID3v2Frame* frame : frames) {
        if (!frame) {
            continue;
        }

        if (const auto* comm = frame->getIf<CommentFrame>()) {
            if (comment.empty()) {
                comment = comm->text;
            }
            continue;
        }

        const std::string* text = firstText(*frame);
        if (!text) {
            continue;
        }

        const std::string& id = frame->frameId();
        if (id == "TIT2") {
            writeString(block.data() + TITLE_OFFSET, 30, *text);
        } else if (id == "TPE1") {
            writeString(block.data() + ARTIST_OFFSET, 30, *text);
        } else if (id == "TALB") {
            writeString(block.data() + ALBUM_OFFSET, 30, *text);
        } else if (id == "TDRC" || id == "TYER") {
            writeString(block.data() + YEAR_OFFSET, 4, *text);
        } else if (id == "TRCK") {
            auto track = parseIndex(text->substr(0, text->find('/')));
            if (track && *track > 0 && *track <= 255) {
                block[TRACK_MARKER_OFFSET] = 0;
                block[TRACK_OFFSET] = static_cast<uint8_t>(*track);
                has_track = true;
            }
        } else if (id == "TCON") {
            auto genres = parseGenre(*text);
            if (!genres.empty()) {
                auto index = genreIndex(genres.front());
                block[GENRE_OFFSET] = index ? *index : GENRE_NONE;
            }
        }
    }

    writeString(block.data() + COMMENT_OFFSET, has_track ? 28 : 30, comment);
    return block;
}

std::vector<std::string> ID3v1Tag::parseGenre(const std::string& text) {
    std::vector<std::string> genres;
    const std::string trimmed = trimWhitespace(text);
    if (trimmed.empty()) {
        return genres;
    }

    std::string remaining = trimmed;
    while (!remaining.empty()) {
        if (remaining[0] == '(') {
            size_t close = remaining.find(')');
            if (close == std::string::npos) {
                genres.push_back(remaining);
                break;
            }

            std::string inner = remaining.substr(1, close - 1);
            remaining.erase(0, close + 1);

            if (inner == "RX") {
                genres.push_back("Remix");
            } else if (inner == "CR") {
                genres.push_back("Cover");
            } else if (auto index = parseIndex(inner)) {
                if (*index < GENRE_COUNT) {
                    genres.push_back(s_genre_list[*index]);
                } else {
                    genres.push_back("Unknown(" + std::to_string(*index) + ")");
                }
            } else {
                genres.push_back(inner);
            }
            continue;
        }

        if (parseIndex(remaining)) {
            genres.push_back(genreOrText(remaining));
            break;
        }

        // v2.4 NUL-separated list
        size_t start = 0;
        while (start <= remaining.size()) {
            size_t end = remaining.find('\0', start);
            if (end == std::string::npos) {
                end = remaining.size();
            }
            std::string part = trimWhitespace(remaining.substr(start, end - start));
            if (!part.empty()) {
                genres.push_back(genreOrText(part));
            }
            start = end + 1;
        }
        break;
    }

    if (genres.empty()) {
        genres.push_back(trimmed);
    }
    return genres;
}

} // namespace Tag
} // namespace TagSmith
