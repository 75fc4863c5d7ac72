/*
 * exceptions.cpp - Exception classes code
 * This file is part of TagSmith.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#include "tagsmith.h"

namespace TagSmith {
namespace Core {

/**
 * @brief Constructs an IOException.
 *
 * Thrown when a file backing a load, save or remove operation cannot be
 * opened, read, written or truncated.
 * @param why A string describing the I/O error.
 */
IOException::IOException(const std::string &why)
    : std::exception(), m_why(why) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 * @return A C-style string detailing the I/O error.
 */
const char *IOException::what() const noexcept { return m_why.c_str(); }

/**
 * @brief Constructs a DecompressionException.
 *
 * Raised by a Decompressor when the input stream is corrupt or ends
 * before the compressed data is complete.
 * @param why A string describing the decompression failure.
 */
DecompressionException::DecompressionException(const std::string &why)
    : std::exception(), m_why(why) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 * @return A C-style string detailing the decompression failure.
 */
const char *DecompressionException::what() const noexcept { return m_why.c_str(); }

/**
 * @brief Constructs an ID3Exception.
 *
 * Generic ID3 error for malformed structural fields, such as a truncated
 * comment frame or an invalid text encoding byte.
 * @param why A string describing the nature of the format error.
 */
ID3Exception::ID3Exception(const std::string &why)
    : std::exception(), m_why(why) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 * @return A C-style string detailing the format error.
 */
const char *ID3Exception::what() const noexcept { return m_why.c_str(); }

ID3NoHeaderException::ID3NoHeaderException()
    : ID3Exception("No ID3 header found") {
}

/**
 * @brief Constructs an ID3UnsupportedVersionException.
 * @param major Major version byte found in the header.
 * @param revision Revision byte found in the header.
 */
ID3UnsupportedVersionException::ID3UnsupportedVersionException(uint8_t major, uint8_t revision)
    : ID3Exception("Unsupported ID3 version: ID3v2." + std::to_string(major) + "." +
                   std::to_string(revision)) {
}

ID3BadUnsynchDataException::ID3BadUnsynchDataException()
    : ID3Exception("Bad unsynchronisation data") {
}

ID3BadCompressedDataException::ID3BadCompressedDataException(const std::string &why)
    : ID3Exception("Bad compressed data: " + why) {
}

} // namespace Core
} // namespace TagSmith
