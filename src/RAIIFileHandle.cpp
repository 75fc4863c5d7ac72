/*
 * RAIIFileHandle.cpp - Implementation of RAII wrapper for FILE* handles
 * This file is part of TagSmith.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
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
namespace IO {

using Core::IOException;

RAIIFileHandle::RAIIFileHandle() noexcept : m_file(nullptr), m_owns_handle(false) {
}

RAIIFileHandle::RAIIFileHandle(RAIIFileHandle&& other) noexcept
    : m_file(other.m_file), m_owns_handle(other.m_owns_handle) {
    other.m_file = nullptr;
    other.m_owns_handle = false;
}

RAIIFileHandle& RAIIFileHandle::operator=(RAIIFileHandle&& other) noexcept {
    if (this != &other) {
        close();
        m_file = other.m_file;
        m_owns_handle = other.m_owns_handle;
        other.m_file = nullptr;
        other.m_owns_handle = false;
    }
    return *this;
}

RAIIFileHandle::~RAIIFileHandle() noexcept {
    close();
}

bool RAIIFileHandle::open(const char* filename, const char* mode) noexcept {
    close();

    if (!filename || !mode) {
        return false;
    }

    m_file = fopen(filename, mode);
    m_owns_handle = (m_file != nullptr);
    return m_file != nullptr;
}

int RAIIFileHandle::close() noexcept {
    int result = 0;

    if (m_file && m_owns_handle) {
        result = fclose(m_file);
    }

    m_file = nullptr;
    m_owns_handle = false;
    return result;
}

// ============================================================================
// Checked I/O
// ============================================================================

size_t RAIIFileHandle::readSome(uint8_t* buffer, size_t count) {
    if (!m_file) {
        throw IOException("read on a closed file handle");
    }
    size_t got = fread(buffer, 1, count, m_file);
    if (got < count && ferror(m_file)) {
        throw IOException(std::string("read failed: ") + strerror(errno));
    }
    return got;
}

std::vector<uint8_t> RAIIFileHandle::readAll() {
    std::vector<uint8_t> data;
    uint8_t chunk[8192];
    size_t got;
    while ((got = readSome(chunk, sizeof(chunk))) > 0) {
        data.insert(data.end(), chunk, chunk + got);
        if (got < sizeof(chunk)) {
            break;
        }
    }
    Debug::log("io", "RAIIFileHandle::readAll: read ", data.size(), " bytes");
    return data;
}

void RAIIFileHandle::writeAll(const uint8_t* data, size_t size) {
    if (!m_file) {
        throw IOException("write on a closed file handle");
    }
    if (size > 0 && fwrite(data, 1, size, m_file) != size) {
        throw IOException(std::string("write failed: ") + strerror(errno));
    }
}

void RAIIFileHandle::seek(off_t offset, int whence) {
    if (!m_file) {
        throw IOException("seek on a closed file handle");
    }
    if (fseeko(m_file, offset, whence) != 0) {
        throw IOException(std::string("seek failed: ") + strerror(errno));
    }
}

off_t RAIIFileHandle::size() const {
    if (!m_file) {
        throw IOException("stat on a closed file handle");
    }
    struct stat st;
    if (fstat(fileno(m_file), &st) != 0) {
        throw IOException(std::string("fstat failed: ") + strerror(errno));
    }
    return st.st_size;
}

void RAIIFileHandle::truncate(off_t length) {
    if (!m_file) {
        throw IOException("truncate on a closed file handle");
    }
    if (fflush(m_file) != 0) {
        throw IOException(std::string("flush failed: ") + strerror(errno));
    }
    if (ftruncate(fileno(m_file), length) != 0) {
        throw IOException(std::string("truncate failed: ") + strerror(errno));
    }
    Debug::log("io", "RAIIFileHandle::truncate: file cut to ", length, " bytes");
}

RAIIFileHandle make_file_handle(const char* filename, const char* mode) {
    RAIIFileHandle handle;
    if (!handle.open(filename, mode)) {
        Debug::log("io", "make_file_handle: cannot open ", (filename ? filename : "null"),
                   " (", mode, "): ", strerror(errno));
        throw IOException(std::string("cannot open ") + (filename ? filename : "null") +
                          ": " + strerror(errno));
    }
    Debug::log("io", "make_file_handle: opened ", filename, " mode ", mode);
    return handle;
}

} // namespace IO
} // namespace TagSmith
