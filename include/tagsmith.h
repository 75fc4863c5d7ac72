/*
 * tagsmith.h - Main header, pulls in everything a translation unit needs
 * This file is part of TagSmith.
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

#ifndef __TAGSMITH_H__
#define __TAGSMITH_H__

// defines
#define TAGSMITH_VERSION "1.0.0"
#define TAGSMITH_MAINTAINER "Kirn Gill II <segin2005@gmail.com>"

//
// C++ Standard Library
#include <algorithm>
#include <array>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <sstream>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>
#include <optional>
#include <chrono>
#include <limits>

// C Standard Library (wrapped)
#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

// System-specific headers
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

// zlib for compressed ID3v2 frames
#include <zlib.h>

// Local headers
#include "debug.h"
#include "exceptions.h"
#include "RAIIFileHandle.h"

// Core utilities
#include "core/utility/UTF8Util.h"
#include "core/compression/Decompressor.h"
#include "core/compression/ZlibDecompressor.h"

// Tag engine
#include "tag/TagConstants.h"
#include "tag/ID3v2Utils.h"
#include "tag/ID3v2Header.h"
#include "tag/ID3v2Frame.h"
#include "tag/ID3v2Tag.h"
#include "tag/ID3v1Tag.h"
#include "tag/ID3v2Writer.h"
#include "tag/ID3File.h"

#endif // __TAGSMITH_H__
