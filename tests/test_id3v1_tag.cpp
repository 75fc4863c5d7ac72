/*
 * test_id3v1_tag.cpp - Unit tests for the ID3v1 block reader and writer
 * This file is part of TagSmith.
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tagsmith.h"
#include "test_framework.h"

using namespace TagSmith::Tag;
using namespace TestFramework;
using namespace TestFramework::ByteTestUtils;

// Build a 128-byte block field by field
static std::vector<uint8_t> makeBlock(const std::string& title, const std::string& artist,
                                      const std::string& album, const std::string& year,
                                      const std::string& comment, uint8_t track, uint8_t genre) {
    std::vector<uint8_t> block(ID3v1Tag::TAG_SIZE, 0);
    std::memcpy(block.data(), "TAG", 3);
    std::memcpy(block.data() + 3, title.data(), std::min<size_t>(30, title.size()));
    std::memcpy(block.data() + 33, artist.data(), std::min<size_t>(30, artist.size()));
    std::memcpy(block.data() + 63, album.data(), std::min<size_t>(30, album.size()));
    std::memcpy(block.data() + 93, year.data(), std::min<size_t>(4, year.size()));
    std::memcpy(block.data() + 97, comment.data(), std::min<size_t>(track ? 28 : 30, comment.size()));
    if (track) {
        block[125] = 0;
        block[126] = track;
    }
    block[127] = genre;
    return block;
}

static const ID3v2Frame* findFrame(const std::vector<ID3v2Frame>& frames, const std::string& id) {
    for (const auto& frame : frames) {
        if (frame.frameId() == id) {
            return &frame;
        }
    }
    return nullptr;
}

static std::string textOf(const std::vector<ID3v2Frame>& frames, const std::string& id) {
    const ID3v2Frame* frame = findFrame(frames, id);
    if (!frame || frame->textValues().empty()) {
        return "";
    }
    return frame->textValues().front();
}

// ============================================================================
// Detection
// ============================================================================

static void test_is_valid() {
    auto block = makeBlock("", "", "", "", "", 0, 255);
    ASSERT_TRUE(ID3v1Tag::isValid(block.data(), block.size()), "TAG block accepted");
    ASSERT_FALSE(ID3v1Tag::isValid(block.data(), 127), "short block rejected");
    ASSERT_FALSE(ID3v1Tag::isValid(nullptr, 128), "null data rejected");

    block[0] = 'X';
    ASSERT_FALSE(ID3v1Tag::isValid(block.data(), block.size()), "missing magic rejected");
}

static void test_find_id3v1() {
    auto file = concat({bytes("audio data here"), makeBlock("t", "", "", "", "", 0, 255)});
    auto offset = ID3v1Tag::findID3v1(file.data(), file.size());
    ASSERT_TRUE(offset.has_value(), "block found at end of data");
    ASSERT_EQUALS(15u, *offset, "offset of the block");

    auto plain = bytes(std::string(200, 'a'));
    ASSERT_FALSE(ID3v1Tag::findID3v1(plain.data(), plain.size()).has_value(), "no block in plain data");
}

// ============================================================================
// Parsing
// ============================================================================

static void test_parse_v11() {
    auto block = makeBlock("My Song", "Artist   ", "Album", "1999", "Nice", 5, 17);
    auto frames = ID3v1Tag::parse(block.data(), block.size());

    ASSERT_EQUALS(std::string("My Song"), textOf(frames, "TIT2"), "title");
    ASSERT_EQUALS(std::string("Artist"), textOf(frames, "TPE1"), "trailing spaces trimmed");
    ASSERT_EQUALS(std::string("Album"), textOf(frames, "TALB"), "album");
    ASSERT_EQUALS(std::string("1999"), textOf(frames, "TDRC"), "year as TDRC");
    ASSERT_EQUALS(std::string("5"), textOf(frames, "TRCK"), "v1.1 track number");
    ASSERT_EQUALS(std::string("Rock"), textOf(frames, "TCON"), "genre name");

    const ID3v2Frame* comment = findFrame(frames, "COMM");
    ASSERT_NOT_NULL(comment, "comment present");
    ASSERT_EQUALS(std::string("Nice"), comment->get<CommentFrame>().text, "comment text");
    ASSERT_EQUALS(std::string("XXX"), comment->get<CommentFrame>().lang, "comment language unknown");
    ASSERT_EQUALS(std::string("COMM::XXX"), comment->hashKey().str(), "comment key");
}

static void test_parse_v10_long_comment() {
    std::string comment(30, 'c');
    auto block = makeBlock("T", "", "", "", comment, 0, 255);
    auto frames = ID3v1Tag::parse(block.data(), block.size());

    ASSERT_NULL(findFrame(frames, "TRCK"), "no track in ID3v1.0");
    ASSERT_NULL(findFrame(frames, "TCON"), "genre 255 yields no TCON");
    ASSERT_EQUALS(comment, findFrame(frames, "COMM")->get<CommentFrame>().text, "full 30-byte comment");
}

static void test_parse_empty_fields_skipped() {
    auto block = makeBlock("", "   ", "", "", "", 0, 255);
    auto frames = ID3v1Tag::parse(block.data(), block.size());
    ASSERT_TRUE(frames.empty(), "blank fields produce no frames");
}

static void test_parse_latin1() {
    auto block = makeBlock("Caf\xE9", "", "", "", "", 0, 255);
    auto frames = ID3v1Tag::parse(block.data(), block.size());
    ASSERT_EQUALS(std::string("Caf\xC3\xA9"), textOf(frames, "TIT2"), "Latin-1 decoded to UTF-8");
    ASSERT_EQUALS(static_cast<int>(TextEncoding::Latin1),
                  static_cast<int>(findFrame(frames, "TIT2")->get<TextFrame>().encoding), "Latin-1 encoding kept");
}

static void test_parse_uses_last_block() {
    auto file = concat({makeBlock("first", "", "", "", "", 0, 255), bytes("xx"),
                        makeBlock("second", "", "", "", "", 0, 255)});
    auto frames = ID3v1Tag::parse(file.data(), file.size());
    ASSERT_EQUALS(std::string("second"), textOf(frames, "TIT2"), "last 128 bytes read");

    auto junk = bytes(std::string(128, 'x'));
    ASSERT_TRUE(ID3v1Tag::parse(junk.data(), junk.size()).empty(), "no TAG magic gives nothing");
}

// ============================================================================
// Writing
// ============================================================================

static void test_make_fields() {
    std::vector<ID3v2Frame> frames;
    frames.push_back(TextFrame{"TIT2", TextEncoding::UTF8, {"Caf\xC3\xA9"}});
    frames.push_back(TextFrame{"TPE1", TextEncoding::UTF8, {"Band"}});
    frames.push_back(TextFrame{"TDRC", TextEncoding::UTF8, {"2001-05-03"}});
    frames.push_back(TextFrame{"TRCK", TextEncoding::UTF8, {"7/12"}});
    frames.push_back(TextFrame{"TCON", TextEncoding::UTF8, {"(9)"}});
    CommentFrame comm;
    comm.text = std::string(40, 'z');
    frames.push_back(comm);

    std::vector<const ID3v2Frame*> refs;
    for (const auto& frame : frames) {
        refs.push_back(&frame);
    }
    auto block = ID3v1Tag::make(refs);

    ASSERT_EQUALS(ID3v1Tag::TAG_SIZE, block.size(), "128 bytes");
    assertBytesEqual(bytes("TAG"), std::vector<uint8_t>(block.begin(), block.begin() + 3), "magic");
    assertBytesEqual({'C', 'a', 'f', 0xE9, 0x00}, std::vector<uint8_t>(block.begin() + 3, block.begin() + 8),
                     "title written as Latin-1");
    assertBytesEqual(bytes("2001"), std::vector<uint8_t>(block.begin() + 93, block.begin() + 97), "year truncated");
    ASSERT_EQUALS(0, static_cast<int>(block[125]), "track marker");
    ASSERT_EQUALS(7, static_cast<int>(block[126]), "track before the slash");
    ASSERT_EQUALS(9, static_cast<int>(block[127]), "genre index");
    assertBytesEqual(bytes(std::string(28, 'z')), std::vector<uint8_t>(block.begin() + 97, block.begin() + 125),
                     "comment limited to 28 bytes with a track");
}

static void test_make_defaults() {
    auto block = ID3v1Tag::make({});
    ASSERT_EQUALS(255, static_cast<int>(block[127]), "no genre written as 255");
    ASSERT_EQUALS(0, static_cast<int>(block[126]), "no track");

    ID3v2Frame genre(TextFrame{"TCON", TextEncoding::UTF8, {"Not A Genre"}});
    auto unknown = ID3v1Tag::make({&genre});
    ASSERT_EQUALS(255, static_cast<int>(unknown[127]), "unknown genre name written as 255");
}

static void test_make_then_parse() {
    ID3v2Frame title(TextFrame{"TIT2", TextEncoding::UTF8, {"Round"}});
    ID3v2Frame genre(TextFrame{"TCON", TextEncoding::UTF8, {"Synthpop"}});
    auto block = ID3v1Tag::make({&title, &genre});
    auto frames = ID3v1Tag::parse(block.data(), block.size());

    ASSERT_EQUALS(std::string("Round"), textOf(frames, "TIT2"), "title survives");
    ASSERT_EQUALS(std::string("Synthpop"), textOf(frames, "TCON"), "Winamp genre survives");
}

// ============================================================================
// Genres
// ============================================================================

static void test_parse_genre() {
    using Genres = std::vector<std::string>;
    ASSERT_TRUE(ID3v1Tag::parseGenre("17") == Genres({"Rock"}), "bare number");
    ASSERT_TRUE(ID3v1Tag::parseGenre("(17)") == Genres({"Rock"}), "parenthesised number");
    ASSERT_TRUE(ID3v1Tag::parseGenre("(17)Rock") == Genres({"Rock", "Rock"}), "number then refinement");
    ASSERT_TRUE(ID3v1Tag::parseGenre("(RX)(CR)") == Genres({"Remix", "Cover"}), "RX and CR");
    ASSERT_TRUE(ID3v1Tag::parseGenre("(250)") == Genres({"Unknown(250)"}), "out of range number");
    ASSERT_TRUE(ID3v1Tag::parseGenre(std::string("Jazz\0" "9", 6)) == Genres({"Jazz", "Metal"}),
                "NUL separated list");
    ASSERT_TRUE(ID3v1Tag::parseGenre("  Ambient ") == Genres({"Ambient"}), "free text trimmed");
    ASSERT_TRUE(ID3v1Tag::parseGenre("(broken") == Genres({"(broken"}), "unclosed parenthesis kept");
    ASSERT_TRUE(ID3v1Tag::parseGenre("").empty(), "empty string");
}

static void test_genre_lookup() {
    ASSERT_EQUALS(std::string("Blues"), ID3v1Tag::genreFromIndex(0), "first genre");
    ASSERT_EQUALS(std::string("Psychedelic Rock"), ID3v1Tag::genreFromIndex(93), "Winamp extension");
    ASSERT_EQUALS(std::string(""), ID3v1Tag::genreFromIndex(255), "no genre");
    ASSERT_EQUALS(17, static_cast<int>(*ID3v1Tag::genreIndex("Rock")), "reverse lookup");
    ASSERT_FALSE(ID3v1Tag::genreIndex("rock").has_value(), "lookup is case sensitive");
    ASSERT_EQUALS(ID3v1Tag::GENRE_COUNT, ID3v1Tag::genreList().size(), "table size");
}

int main() {
    TestSuite suite("ID3v1Tag Unit Tests");

    suite.addTest("is_valid", test_is_valid);
    suite.addTest("find_id3v1", test_find_id3v1);

    suite.addTest("parse_v11", test_parse_v11);
    suite.addTest("parse_v10_long_comment", test_parse_v10_long_comment);
    suite.addTest("parse_empty_fields_skipped", test_parse_empty_fields_skipped);
    suite.addTest("parse_latin1", test_parse_latin1);
    suite.addTest("parse_uses_last_block", test_parse_uses_last_block);

    suite.addTest("make_fields", test_make_fields);
    suite.addTest("make_defaults", test_make_defaults);
    suite.addTest("make_then_parse", test_make_then_parse);

    suite.addTest("parse_genre", test_parse_genre);
    suite.addTest("genre_lookup", test_genre_lookup);

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
