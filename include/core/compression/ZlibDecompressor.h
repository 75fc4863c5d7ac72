/*
 * ZlibDecompressor.h - zlib/gzip stream inflater
 * This file is part of TagSmith.
 * Copyright © 2026 The TagSmith Authors
 *
 * Permission to use, copy, modify, and/or distribute this software for any
 * purpose with or without fee is hereby granted, provided that the above
 * copyright notice and this permission notice appear in all copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
 * WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
 * MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
 * ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
 * WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN
 * ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
 * OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
 */

#ifndef TAGSMITH_CORE_COMPRESSION_ZLIBDECOMPRESSOR_H
#define TAGSMITH_CORE_COMPRESSION_ZLIBDECOMPRESSOR_H

#include "core/compression/Decompressor.h"

namespace TagSmith {
namespace Core {
namespace Compression {

/**
 * @brief zlib Decompressor implementation
 *
 * Accepts both zlib and gzip wrapped streams. The whole input must form one
 * complete stream; a stream that ends early is treated as corrupt.
 */
class ZlibDecompressor : public Decompressor {
public:
    std::vector<uint8_t> decompress(const uint8_t* data, size_t size) override;

    static constexpr size_t CHUNK_SIZE = 4000;
};

} // namespace Compression
} // namespace Core
} // namespace TagSmith

#endif // TAGSMITH_CORE_COMPRESSION_ZLIBDECOMPRESSOR_H
