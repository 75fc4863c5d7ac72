/*
 * RAIIFileHandle.h - RAII wrapper for FILE* handles
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

#ifndef RAIIFILEHANDLE_H
#define RAIIFILEHANDLE_H

// No direct includes - all includes should be in tagsmith.h

namespace TagSmith {
namespace IO {

/**
 * @brief RAII wrapper for FILE* handles with automatic cleanup
 *
 * Owns a stdio stream for the duration of a load, save or remove. The
 * checked helpers (readSome, readAll, writeAll, seek, truncate) throw
 * TagSmith::Core::IOException so callers never see a half-written file
 * silently.
 */
class RAIIFileHandle {
public:
    RAIIFileHandle() noexcept;

    RAIIFileHandle(RAIIFileHandle&& other) noexcept;
    RAIIFileHandle& operator=(RAIIFileHandle&& other) noexcept;

    /**
     * @brief Destructor - automatically closes file if owned
     */
    ~RAIIFileHandle() noexcept;

    RAIIFileHandle(const RAIIFileHandle&) = delete;
    RAIIFileHandle& operator=(const RAIIFileHandle&) = delete;

    /**
     * @brief Open a file with RAII management
     * @param filename Path to the file to open
     * @param mode File open mode (e.g., "rb", "r+b")
     * @return true if file was opened successfully, false otherwise
     */
    bool open(const char* filename, const char* mode) noexcept;

    /**
     * @brief Close the file handle if owned
     * @return 0 on success, EOF on error (same as fclose)
     */
    int close() noexcept;

    // ========================================================================
    // Checked I/O
    // ========================================================================

    /**
     * @brief Read up to @p count bytes
     * @return Bytes actually read; fewer than requested only at end of file
     * @throws IOException on a stream error
     */
    size_t readSome(uint8_t* buffer, size_t count);

    /**
     * @brief Read from the current position to end of file
     */
    std::vector<uint8_t> readAll();

    /**
     * @brief Write every byte or throw IOException
     */
    void writeAll(const uint8_t* data, size_t size);

    /**
     * @brief fseeko wrapper
     * @throws IOException when the seek fails
     */
    void seek(off_t offset, int whence);

    /**
     * @brief Total file size in bytes, via fstat
     */
    off_t size() const;

    /**
     * @brief Flush buffered output and cut the file to @p length bytes
     */
    void truncate(off_t length);

private:
    FILE* m_file;           // The managed FILE* handle
    bool m_owns_handle;     // Whether we own the handle and should close it
};

/**
 * @brief Open @p filename or throw IOException naming the file and errno
 */
RAIIFileHandle make_file_handle(const char* filename, const char* mode);

} // namespace IO
} // namespace TagSmith

#endif // RAIIFILEHANDLE_H
