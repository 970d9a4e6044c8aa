/*
 * GatewayChunkSource.cpp - Chunk source backed by an MTProto file gateway
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"

namespace TGStream {
namespace Upstream {

using Core::UpstreamFatalException;
using Core::UpstreamRelocatedException;
using Core::UpstreamTransientException;

GatewayChunkSource::GatewayChunkSource(std::string base_url, int dc_id, int timeout_seconds,
                                       size_t session_cache_size)
    : m_base_url(std::move(base_url))
    , m_dc_id(dc_id)
    , m_timeout(timeout_seconds)
    , m_sessions(session_cache_size)
{
}

size_t GatewayChunkSource::cachedSessions()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

std::string GatewayChunkSource::describe() const
{
    return m_base_url + " (dc " + std::to_string(m_dc_id) + ")";
}

void GatewayChunkSource::throwForStatus(const HTTPClient::Response& response, const std::string& what)
{
    if (response.statusCode == 0) {
        // Transport level failure: refused, reset, timed out
        throw UpstreamTransientException(what + ": " + response.statusMessage, std::chrono::milliseconds(0));
    }

    if (response.statusCode == 420) {
        long seconds = 1;
        std::string retry_after = response.header("Retry-After");
        if (!retry_after.empty() && retry_after.find_first_not_of("0123456789") == std::string::npos &&
            retry_after.size() < 7) {
            seconds = std::stol(retry_after);
        }
        throw UpstreamTransientException(what + ": flood wait " + std::to_string(seconds) + "s",
                                         std::chrono::seconds(seconds));
    }

    if (response.statusCode == 303) {
        std::string dc = response.header("X-Migrate-To-DC");
        if (dc.empty() || dc.size() > 4 || dc.find_first_not_of("0123456789") != std::string::npos) {
            throw UpstreamFatalException(what + ": relocation without a valid X-Migrate-To-DC header");
        }
        int new_dc = std::stoi(dc);
        throw UpstreamRelocatedException(what + ": file migrated to dc " + dc, new_dc);
    }

    throw UpstreamFatalException(what + ": gateway answered HTTP " + std::to_string(response.statusCode) +
                                 (response.body.empty() ? "" : " (" + response.body.substr(0, 200) + ")"));
}

std::string GatewayChunkSource::sessionFor(const Stream::FileLocator& locator)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto cached = m_sessions.get(locator.unique_id);
        if (cached && cached->dc_id == locator.dc_id) {
            return cached->token;
        }
    }

    std::string url = m_base_url + "/session?dc=" + std::to_string(locator.dc_id);
    auto response = HTTPClient::get(url, {}, m_timeout);
    if (!response.success) {
        throwForStatus(response, "Session for dc " + std::to_string(locator.dc_id));
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    const char* begin = response.body.data();
    if (!reader->parse(begin, begin + response.body.size(), &root, &errors) ||
        !root.isObject() || !root["session"].isString() || root["session"].asString().empty()) {
        throw UpstreamFatalException("Gateway returned a malformed session reply: " + errors);
    }

    Session session;
    session.dc_id = locator.dc_id;
    session.token = root["session"].asString();
    Debug::log("source", describe(), ": negotiated media session for dc ", locator.dc_id);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_sessions.put(locator.unique_id, session);
    return session.token;
}

void GatewayChunkSource::dropSession(const std::string& unique_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sessions.erase(unique_id);
}

std::vector<uint8_t> GatewayChunkSource::fetch(const Stream::FileLocator& locator,
                                               uint64_t offset,
                                               uint32_t length,
                                               const std::atomic<bool>& cancel)
{
    std::string session = sessionFor(locator);

    std::string url = m_base_url + "/file?session=" + HTTPClient::urlEncode(session) +
                      "&location=" + HTTPClient::urlEncode(locator.location) +
                      "&offset=" + std::to_string(offset) +
                      "&limit=" + std::to_string(length);

    auto response = HTTPClient::get(url, {}, m_timeout, &cancel);
    if (response.cancelled) {
        return {};
    }
    if (response.statusCode == 401) {
        // Media session expired on the gateway side
        dropSession(locator.unique_id);
        throw UpstreamTransientException("Media session expired", std::chrono::milliseconds(0));
    }
    if (!response.success) {
        throwForStatus(response, "Chunk at byte " + std::to_string(offset));
    }
    if (response.body.size() > length) {
        throw UpstreamFatalException("Gateway returned " + std::to_string(response.body.size()) +
                                     " bytes for a " + std::to_string(length) + " byte chunk");
    }

    DEBUG_LOG_LAZY("source", describe(), ": ", response.body.size(), " bytes at ", offset);
    return std::vector<uint8_t>(response.body.begin(), response.body.end());
}

void GatewayChunkSource::relocate(Stream::FileLocator& locator, int new_dc)
{
    dropSession(locator.unique_id);
    Debug::log("source", describe(), ": rebinding ", locator.unique_id, " from dc ", locator.dc_id,
               " to dc ", new_dc);
    locator.dc_id = new_dc;
}

} // namespace Upstream
} // namespace TGStream
