/*
 * exceptions.cpp - Exception classes code
 * This file is part of TGStream.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"

namespace TGStream {
namespace Core {

/**
 * @brief Constructs a StreamException.
 *
 * Common base for every failure a streaming request can end with. The HTTP
 * status is what the server adapter answers the client with.
 * @param why A string describing the reason for the failure.
 * @param http_status Status code to report to the HTTP client.
 */
StreamException::StreamException(const std::string& why, int http_status)
    : std::exception(), m_why(why), m_http_status(http_status) {
  // ctor
}

/**
 * @brief Returns the exception's explanatory string.
 * @return A C-style string detailing the failure.
 */
const char *StreamException::what() const noexcept { return m_why.c_str(); }

/**
 * @brief Constructs an InvalidRequestException.
 *
 * Thrown when the request identifier is missing or cannot be decoded, or the
 * request is otherwise malformed.
 * @param why A string describing what was wrong with the request.
 */
InvalidRequestException::InvalidRequestException(const std::string& why)
    : StreamException(why, 400) {
  // ctor
}

/**
 * @brief Constructs a RangeNotSatisfiableException.
 * @param why A string describing why the range was rejected.
 * @param file_size Size of the file, reported back in Content-Range.
 */
RangeNotSatisfiableException::RangeNotSatisfiableException(const std::string& why, uint64_t file_size)
    : StreamException(why, 416), m_file_size(file_size) {
  // ctor
}

/**
 * @brief Content-Range value for a 416 response.
 * @return Unsatisfied-range form naming only the total size.
 */
std::string RangeNotSatisfiableException::contentRange() const {
  return "bytes */" + std::to_string(m_file_size);
}

HashMismatchException::HashMismatchException(const std::string& why)
    : StreamException(why, 403) {
  // ctor
}

FileNotFoundException::FileNotFoundException(const std::string& why)
    : StreamException(why, 404) {
  // ctor
}

/**
 * @brief Constructs an UpstreamTransientException.
 *
 * Raised by chunk sources when the remote side asks us to slow down (flood
 * wait) or the connection dropped momentarily.
 * @param why A string describing the condition.
 * @param retry_after How long the remote side asked us to wait.
 */
UpstreamTransientException::UpstreamTransientException(const std::string& why,
                                                       std::chrono::milliseconds retry_after)
    : StreamException(why, 503), m_retry_after(retry_after) {
  // ctor
}

/**
 * @brief Constructs an UpstreamRelocatedException.
 * @param why A string describing the condition.
 * @param new_dc Data center the file now lives on.
 */
UpstreamRelocatedException::UpstreamRelocatedException(const std::string& why, int new_dc)
    : StreamException(why, 502), m_new_dc(new_dc) {
  // ctor
}

UpstreamFatalException::UpstreamFatalException(const std::string& why)
    : StreamException(why, 502) {
  // ctor
}

/**
 * @brief Constructs a ConfigException.
 *
 * Thrown while loading the configuration file or parsing the command line.
 * Fatal at startup.
 * @param why A string describing the bad setting.
 */
ConfigException::ConfigException(const std::string& why)
    : std::exception(), m_why(why) {
  // ctor
}

const char *ConfigException::what() const noexcept { return m_why.c_str(); }

} // namespace Core
} // namespace TGStream
