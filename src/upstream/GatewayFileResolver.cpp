/*
 * GatewayFileResolver.cpp - File metadata lookup through MTProto gateways
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

GatewayFileResolver::GatewayFileResolver(std::vector<Core::GatewayEndpoint> gateways,
                                         size_t cache_size,
                                         int timeout_seconds)
    : m_gateways(std::move(gateways))
    , m_timeout(timeout_seconds)
    , m_cache(cache_size)
{
    if (m_gateways.empty()) {
        throw std::invalid_argument("GatewayFileResolver needs at least one gateway");
    }
}

Stream::FileLocator GatewayFileResolver::parseMessageReply(const std::string& body)
{
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors) || !root.isObject()) {
        throw UpstreamFatalException("Malformed message reply: " + errors);
    }

    if (!root["file_unique_id"].isString() || !root["file_size"].isUInt64() ||
        !root["dc_id"].isInt() || !root["location"].isString()) {
        throw UpstreamFatalException("Message reply lacks file_unique_id, file_size, dc_id or location");
    }

    Stream::FileLocator locator;
    locator.unique_id = root["file_unique_id"].asString();
    locator.size = root["file_size"].asUInt64();
    locator.dc_id = root["dc_id"].asInt();
    locator.location = root["location"].asString();
    locator.mime_type = root.get("mime_type", "").asString();
    locator.file_name = root.get("file_name", "").asString();
    if (locator.mime_type.empty()) {
        locator.mime_type = "application/octet-stream";
    }
    return locator;
}

Stream::FileLocator GatewayFileResolver::resolve(int64_t chat_id, int64_t message_id)
{
    const Key key(chat_id, message_id);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (auto cached = m_cache.get(key)) {
            return *cached;
        }
    }

    std::string last_error;
    size_t first = m_next_gateway.fetch_add(1);
    for (size_t attempt = 0; attempt < m_gateways.size(); ++attempt) {
        const auto& gateway = m_gateways[(first + attempt) % m_gateways.size()];
        std::string url = gateway.url + "/message?chat_id=" + std::to_string(chat_id) +
                          "&message_id=" + std::to_string(message_id);

        auto response = HTTPClient::get(url, {}, m_timeout);
        if (response.statusCode == 0) {
            last_error = gateway.url + ": " + response.statusMessage;
            Debug::log("resolver", "Gateway unreachable, trying next: ", last_error);
            continue;
        }
        if (response.statusCode == 404) {
            throw Core::FileNotFoundException("Message " + std::to_string(message_id) + " in chat " +
                                              std::to_string(chat_id) + " has no media");
        }
        if (!response.success) {
            throw UpstreamFatalException("Resolving message " + std::to_string(message_id) + " failed: HTTP " +
                                         std::to_string(response.statusCode));
        }

        Stream::FileLocator locator = parseMessageReply(response.body);
        Debug::log("resolver", "Message ", message_id, " in chat ", chat_id, " is ", locator.unique_id,
                   " (", locator.size, " bytes, dc ", locator.dc_id, ")");

        std::lock_guard<std::mutex> lock(m_mutex);
        m_cache.put(key, locator);
        return locator;
    }

    throw UpstreamFatalException("No gateway could resolve message " + std::to_string(message_id) + ": " +
                                 last_error);
}

size_t GatewayFileResolver::cachedCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cache.size();
}

} // namespace Upstream
} // namespace TGStream
