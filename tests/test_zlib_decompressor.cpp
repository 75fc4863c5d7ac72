/*
 * test_zlib_decompressor.cpp - Unit tests for the zlib frame inflater
 * This file is part of TagSmith.
 * Copyright © 2025 The TagSmith Authors
 *
 * TagSmith is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tagsmith.h"
#include "test_framework.h"

using namespace TagSmith::Core;
using namespace TagSmith::Core::Compression;
using namespace TestFramework;
using namespace TestFramework::ByteTestUtils;

static std::vector<uint8_t> deflateBytes(const std::vector<uint8_t>& data) {
    uLongf length = compressBound(static_cast<uLong>(data.size()));
    std::vector<uint8_t> out(length);
    if (compress(out.data(), &length, data.data(), static_cast<uLong>(data.size())) != Z_OK) {
        throw TestSetupFailure("zlib compress failed");
    }
    out.resize(length);
    return out;
}

static void test_inflate_small() {
    ZlibDecompressor inflater;
    auto plain = bytes("hello, tag");
    auto packed = deflateBytes(plain);
    assertBytesEqual(plain, inflater.decompress(packed.data(), packed.size()), "small payload restored");
}

static void test_inflate_multiple_chunks() {
    std::vector<uint8_t> plain;
    for (size_t i = 0; i < ZlibDecompressor::CHUNK_SIZE * 3 + 17; ++i) {
        plain.push_back(static_cast<uint8_t>((i * 31) ^ (i >> 3)));
    }
    auto packed = deflateBytes(plain);

    ZlibDecompressor inflater;
    auto out = inflater.decompress(packed.data(), packed.size());
    ASSERT_EQUALS(plain.size(), out.size(), "output spans several chunks");
    ASSERT_TRUE(out == plain, "content restored");
}

static void test_rejects_bad_input() {
    ZlibDecompressor inflater;

    TestPatterns::assertThrows<DecompressionException>([&inflater]() {
        inflater.decompress(nullptr, 0);
    }, "empty", "empty input rejected");

    auto garbage = bytes("definitely not deflate");
    TestPatterns::assertThrows<DecompressionException>([&]() {
        inflater.decompress(garbage.data(), garbage.size());
    }, "", "garbage rejected");

    auto packed = deflateBytes(bytes(std::string(1000, 'q')));
    packed.resize(packed.size() / 2);
    TestPatterns::assertThrows<DecompressionException>([&]() {
        inflater.decompress(packed.data(), packed.size());
    }, "", "truncated stream rejected");
}

static void test_through_base_class() {
    std::unique_ptr<Decompressor> inflater = std::make_unique<ZlibDecompressor>();
    auto packed = deflateBytes(bytes("via interface"));
    assertBytesEqual(bytes("via interface"), inflater->decompress(packed.data(), packed.size()),
                     "virtual dispatch");
}

int main() {
    TestSuite suite("ZlibDecompressor Unit Tests");

    suite.addTest("inflate_small", test_inflate_small);
    suite.addTest("inflate_multiple_chunks", test_inflate_multiple_chunks);
    suite.addTest("rejects_bad_input", test_rejects_bad_input);
    suite.addTest("through_base_class", test_through_base_class);

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
