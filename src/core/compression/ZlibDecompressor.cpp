/*
 * ZlibDecompressor.cpp - zlib/gzip stream inflater
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

#include "tagsmith.h"

namespace TagSmith {
namespace Core {
namespace Compression {

std::vector<uint8_t> ZlibDecompressor::decompress(const uint8_t* data, size_t size) {
    if (!data || size == 0) {
        throw DecompressionException("empty input");
    }

    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    stream.zalloc = Z_NULL;
    stream.zfree = Z_NULL;
    stream.opaque = Z_NULL;

    // 15: window size; 32: accept zlib or gzip headers
    int result = inflateInit2(&stream, 15 + 32);
    if (result != Z_OK) {
        throw DecompressionException("inflateInit2 failed: " + std::to_string(result));
    }

    stream.next_in = const_cast<Bytef*>(data);
    stream.avail_in = static_cast<uInt>(size);

    std::vector<uint8_t> output;
    size_t chunks = 0;

    do {
        chunks++;
        output.resize(chunks * CHUNK_SIZE);
        stream.next_out = reinterpret_cast<Bytef*>(output.data() + (chunks - 1) * CHUNK_SIZE);
        stream.avail_out = static_cast<uInt>(CHUNK_SIZE);
        result = inflate(&stream, Z_NO_FLUSH);

        if (result != Z_OK && result != Z_STREAM_END) {
            inflateEnd(&stream);
            Debug::log("compression", "ZlibDecompressor::decompress: inflate failed, result=", result);
            throw DecompressionException("inflate failed: " + std::to_string(result));
        }
    } while (result != Z_STREAM_END && stream.avail_out == 0);

    if (result != Z_STREAM_END) {
        inflateEnd(&stream);
        Debug::log("compression", "ZlibDecompressor::decompress: stream truncated after ",
                   stream.total_out, " bytes");
        throw DecompressionException("truncated stream");
    }

    output.resize(stream.total_out);
    inflateEnd(&stream);

    Debug::log("compression", "ZlibDecompressor::decompress: ", size, " -> ", output.size(), " bytes");

    return output;
}

} // namespace Compression
} // namespace Core
} // namespace TagSmith
