/*
 * tgstream.h - main include for all other source files.
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
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

#ifndef __TGSTREAM_H__
#define __TGSTREAM_H__

// defines
#define TGSTREAM_VERSION "1-CURRENT"
#define TGSTREAM_MAINTAINER "Kirn Gill II <segin2005@gmail.com>"
#define TGSTREAM_USER_AGENT "TGStream/1.0"

//
// C++ Standard Library
#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <random>
#include <set>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

// C Standard Library (wrapped)
#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

// System-specific headers
#include <sys/types.h>
#include <unistd.h>
#include <signal.h>
#include <pthread.h>
#if defined(__linux__)
#include <sys/prctl.h>
#elif defined(__FreeBSD__)
#include <pthread.h>
#include <pthread_np.h>
#endif

// OpenSSL headers
#include <openssl/rand.h>
#include <openssl/err.h>

// cURL library
#include <curl/curl.h>

// JsonCpp
#include <json/json.h>

// Boost.Asio / Boost.Beast
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

// Local project headers (in dependency order where possible)
#include "debug.h"
#include "exceptions.h"
#include "BoundedQueue.h"
#include "core/LRUCache.h"

// Core utilities
#include "core/utility/Base64.h"
#include "core/System.h"
#include "core/SignalWatcher.h"
#include "core/Config.h"

// I/O subsystem
#include "io/http/HTTPClient.h"

using TGStream::IO::HTTP::HTTPClient;

// Streaming core
#include "stream/FileLocator.h"
#include "stream/RangeTranslator.h"
#include "stream/ChunkSource.h"
#include "stream/ClientPool.h"
#include "stream/ReorderBuffer.h"
#include "stream/ThroughputMeter.h"
#include "stream/StreamRecord.h"
#include "stream/StreamRegistry.h"
#include "stream/UsageReporter.h"
#include "stream/PrefetchEngine.h"

// Upstream (MTProto gateway) collaborators
#include "upstream/IdentifierCodec.h"
#include "upstream/FileResolver.h"
#include "upstream/GatewayChunkSource.h"
#include "upstream/GatewayFileResolver.h"

// HTTP front end
#include "server/StatsSerializer.h"
#include "server/StreamHandler.h"
#include "server/HTTPServer.h"

#endif // __TGSTREAM_H__
