/*
 * exceptions.h - Various exception classes.
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

#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

#include <exception>
#include <string>

namespace TagSmith {
namespace Core {

// File could not be opened, read, written or truncated.
class IOException : public std::exception
{
    public:
        IOException(const std::string &why);
        ~IOException() noexcept override = default;
        const char *what() const noexcept override;
    private:
        std::string m_why;
};

// Compressed payload could not be inflated.
class DecompressionException : public std::exception
{
    public:
        DecompressionException(const std::string &why);
        ~DecompressionException() noexcept override = default;
        const char *what() const noexcept override;
    private:
        std::string m_why;
};

// Malformed ID3 data. Base of every ID3 error kind.
class ID3Exception : public std::exception
{
    public:
        ID3Exception(const std::string &why);
        ~ID3Exception() noexcept override = default;
        const char *what() const noexcept override;
    private:
        std::string m_why;
};

// No "ID3" magic where a tag was expected. Callers fall back to ID3v1.
class ID3NoHeaderException : public ID3Exception
{
    public:
        ID3NoHeaderException();
        ~ID3NoHeaderException() noexcept override = default;
};

// Major version outside 2..4.
class ID3UnsupportedVersionException : public ID3Exception
{
    public:
        ID3UnsupportedVersionException(uint8_t major, uint8_t revision);
        ~ID3UnsupportedVersionException() noexcept override = default;
};

class ID3BadUnsynchDataException : public ID3Exception
{
    public:
        ID3BadUnsynchDataException();
        ~ID3BadUnsynchDataException() noexcept override = default;
};

// zlib could not inflate a compressed frame.
class ID3BadCompressedDataException : public ID3Exception
{
    public:
        ID3BadCompressedDataException(const std::string &why);
        ~ID3BadCompressedDataException() noexcept override = default;
};

} // namespace Core
} // namespace TagSmith

#endif // EXCEPTIONS_H
