/*
 * ID3v1Tag.h - ID3v1/ID3v1.1 legacy tag codec
 * This file is part of TagSmith.
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef TAGSMITH_TAG_ID3V1TAG_H
#define TAGSMITH_TAG_ID3V1TAG_H

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace TagSmith {
namespace Tag {

/**
 * @brief ID3v1/ID3v1.1 codec
 *
 * ID3v1 is a fixed 128-byte block at the end of the file:
 * - 3 bytes: "TAG" identifier
 * - 30 bytes: Title
 * - 30 bytes: Artist
 * - 30 bytes: Album
 * - 4 bytes: Year
 * - 30 bytes: Comment (28 bytes + null + track in ID3v1.1)
 * - 1 byte: Genre index
 *
 * The block is never kept as its own object. parse() maps it onto the
 * ID3v2 frames an ID3v2Tag can merge, and make() goes the other way.
 */
class ID3v1Tag {
public:
    /// ID3v1 tag size in bytes
    static constexpr size_t TAG_SIZE = 128;

    /// Number of genres in the standard ID3v1 genre list (including Winamp extensions)
    static constexpr size_t GENRE_COUNT = 192;

    /// Genre byte written when no genre is known
    static constexpr uint8_t GENRE_NONE = 255;

    ID3v1Tag() = delete;

    /**
     * @brief Check for "TAG" at the start of a 128-byte block
     */
    static bool isValid(const uint8_t* data, size_t size);

    /**
     * @brief Locate a trailing ID3v1 tag
     * @param data Whole file contents, or at least its tail
     * @param size Size of @p data
     * @return Offset of the "TAG" marker, or empty if there is none
     */
    static std::optional<size_t> findID3v1(const uint8_t* data, size_t size);

    /**
     * @brief Map a 128-byte block onto ID3v2 frames
     *
     * Produces TIT2, TPE1, TALB, TDRC, COMM, TRCK and TCON as present. Empty
     * fields are skipped. Returns nothing if the block is not an ID3v1 tag.
     *
     * @param data Block of at least 128 bytes; the last 128 are used
     * @param size Size of @p data
     */
    static std::vector<ID3v2Frame> parse(const uint8_t* data, size_t size);

    /**
     * @brief Build a 128-byte ID3v1.1 block from ID3v2 frames
     *
     * Text is written as Latin-1 and cut to the field width.
     */
    static std::vector<uint8_t> make(const std::vector<const ID3v2Frame*>& frames);

    /**
     * @brief Resolve a TCON value into genre names
     *
     * Understands "17", "(17)", "(RX)", "(CR)", "(17)Rock" and v2.4
     * NUL-separated lists. Out-of-range parenthesised numbers become
     * "Unknown(n)".
     */
    static std::vector<std::string> parseGenre(const std::string& text);

    /**
     * @brief Get genre string from genre index
     * @return Genre string or empty string if index is invalid/unknown
     */
    static std::string genreFromIndex(uint8_t index);

    /**
     * @brief Table index of a genre name, or empty if not in the table
     */
    static std::optional<uint8_t> genreIndex(const std::string& name);

    static const std::array<std::string, GENRE_COUNT>& genreList();

private:
    /**
     * @brief Decode a fixed-width Latin-1 field
     *
     * Reading stops at the first NUL; trailing whitespace is dropped.
     */
    static std::string trimString(const uint8_t* data, size_t max_len);

    static void writeString(uint8_t* dest, size_t width, const std::string& text);
};

} // namespace Tag
} // namespace TagSmith

#endif // TAGSMITH_TAG_ID3V1TAG_H
