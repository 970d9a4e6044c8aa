/*
 * exceptions.h - Various exception classes.
 * This file is part of TGStream.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef EXCEPTIONS_H
#define EXCEPTIONS_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Core {

// Base of everything a stream request can fail with. Carries the HTTP status
// the adapter answers with.
class StreamException : public std::exception
{
    public:
        StreamException(const std::string& why, int http_status);
        ~StreamException() noexcept override = default;
        const char *what() const noexcept override;
        int httpStatus() const noexcept { return m_http_status; }
    private:
        std::string m_why;
        int m_http_status;
};

// Missing or malformed identifier, bad path, bad query.
class InvalidRequestException : public StreamException
{
    public:
        explicit InvalidRequestException(const std::string& why);
};

// Range header unparsable or outside the file.
class RangeNotSatisfiableException : public StreamException
{
    public:
        RangeNotSatisfiableException(const std::string& why, uint64_t file_size);
        uint64_t fileSize() const noexcept { return m_file_size; }
        std::string contentRange() const;
    private:
        uint64_t m_file_size;
};

// Fingerprint in the request identifier does not match the resolved file.
class HashMismatchException : public StreamException
{
    public:
        explicit HashMismatchException(const std::string& why);
};

// Message exists but carries no streamable media, or does not exist.
class FileNotFoundException : public StreamException
{
    public:
        explicit FileNotFoundException(const std::string& why);
};

// Flood control or a momentary disconnect. Retried locally.
class UpstreamTransientException : public StreamException
{
    public:
        UpstreamTransientException(const std::string& why, std::chrono::milliseconds retry_after);
        std::chrono::milliseconds retryAfter() const noexcept { return m_retry_after; }
    private:
        std::chrono::milliseconds m_retry_after;
};

// File lives on another data center. Re-resolved once.
class UpstreamRelocatedException : public StreamException
{
    public:
        UpstreamRelocatedException(const std::string& why, int new_dc);
        int newDc() const noexcept { return m_new_dc; }
    private:
        int m_new_dc;
};

// Anything upstream we cannot recover from. Terminates the stream.
class UpstreamFatalException : public StreamException
{
    public:
        explicit UpstreamFatalException(const std::string& why);
};

// Bad configuration file or command line value.
class ConfigException : public std::exception
{
    public:
        explicit ConfigException(const std::string& why);
        ~ConfigException() noexcept override = default;
        const char *what() const noexcept override;
    private:
        std::string m_why;
};

} // namespace Core
} // namespace TGStream

#endif // EXCEPTIONS_H
