/*
 * StreamHandler.h - Maps HTTP requests onto streams and stats
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef STREAMHANDLER_H
#define STREAMHANDLER_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Server {

struct HandlerRequest {
    std::string method;
    std::string target;
    std::string range;
    std::string client_host;
};

/**
 * @brief Outcome of one request
 *
 * Either body holds the complete payload, or engine is set and produces
 * content_length bytes. HEAD responses carry content_length with neither.
 */
struct HandlerResponse {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    uint64_t content_length = 0;
    bool head_only = false;
    std::unique_ptr<Stream::PrefetchEngine> engine;

    void setHeader(const std::string& name, const std::string& value);
    std::string header(const std::string& name) const;
};

/**
 * @brief Transport independent request handling
 *
 * Routes:
 *   GET|HEAD /dl/{id}/{name}     file bytes, ranged
 *   GET /stream/stats            registry and pool summary
 *   GET /stream/stats/{id}       one stream record
 *   GET /health                  liveness
 */
class StreamHandler {
public:
    StreamHandler(Stream::ClientPool& pool,
                  Upstream::FileResolver& resolver,
                  Stream::StreamRegistry& registry,
                  Stream::UsageReporter* usage,
                  const Core::Config& config);

    HandlerResponse handle(const HandlerRequest& request);

    static HandlerResponse errorResponse(const Core::StreamException& e);
    static HandlerResponse jsonResponse(int status, const Json::Value& body);
    static std::vector<std::string> splitPath(const std::string& target);

private:
    HandlerResponse handleDownload(const HandlerRequest& request, const std::string& token, const std::string& name);
    HandlerResponse handleStats();
    HandlerResponse handleStreamStats(const std::string& id);
    HandlerResponse handleHealth();

    Stream::ClientPool& m_pool;
    Upstream::FileResolver& m_resolver;
    Stream::StreamRegistry& m_registry;
    Stream::UsageReporter* m_usage;
    uint32_t m_chunk_size;
    Stream::EngineOptions m_engine_options;
    std::chrono::steady_clock::time_point m_started;
};

} // namespace Server
} // namespace TGStream

#endif // STREAMHANDLER_H
