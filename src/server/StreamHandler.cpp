/*
 * StreamHandler.cpp - Maps HTTP requests onto streams and stats
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"

namespace TGStream {
namespace Server {

using Stream::RangeTranslator;
using Upstream::IdentifierCodec;

namespace {

std::string lowercase(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

int hexValue(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percentDecode(const std::string& in)
{
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            int hi = hexValue(in[i + 1]);
            int lo = hexValue(in[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += in[i];
    }
    return out;
}

// Quotes and control characters would break the header
std::string dispositionName(const std::string& name)
{
    std::string out;
    for (char c : name) {
        if (c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20) {
            out += '_';
        } else {
            out += c;
        }
    }
    return out.empty() ? "file" : out;
}

} // namespace

void HandlerResponse::setHeader(const std::string& name, const std::string& value)
{
    std::string key = lowercase(name);
    for (auto& header : headers) {
        if (lowercase(header.first) == key) {
            header.second = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

std::string HandlerResponse::header(const std::string& name) const
{
    std::string key = lowercase(name);
    for (const auto& header : headers) {
        if (lowercase(header.first) == key) {
            return header.second;
        }
    }
    return "";
}

StreamHandler::StreamHandler(Stream::ClientPool& pool,
                             Upstream::FileResolver& resolver,
                             Stream::StreamRegistry& registry,
                             Stream::UsageReporter* usage,
                             const Core::Config& config)
    : m_pool(pool)
    , m_resolver(resolver)
    , m_registry(registry)
    , m_usage(usage)
    , m_chunk_size(config.chunk_size)
    , m_engine_options(Stream::EngineOptions::fromConfig(config))
    , m_started(std::chrono::steady_clock::now())
{
}

std::vector<std::string> StreamHandler::splitPath(const std::string& target)
{
    std::string path = target.substr(0, target.find('?'));
    std::vector<std::string> segments;
    std::stringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (!segment.empty()) {
            segments.push_back(percentDecode(segment));
        }
    }
    return segments;
}

HandlerResponse StreamHandler::jsonResponse(int status, const Json::Value& body)
{
    HandlerResponse response;
    response.status = status;
    response.body = StatsSerializer::write(body);
    response.content_length = response.body.size();
    response.setHeader("Content-Type", "application/json");
    response.setHeader("Access-Control-Allow-Origin", "*");
    return response;
}

HandlerResponse StreamHandler::errorResponse(const Core::StreamException& e)
{
    Json::Value body;
    body["detail"] = e.what();
    HandlerResponse response = jsonResponse(e.httpStatus(), body);
    if (auto range_error = dynamic_cast<const Core::RangeNotSatisfiableException*>(&e)) {
        response.setHeader("Content-Range", range_error->contentRange());
    }
    return response;
}

HandlerResponse StreamHandler::handle(const HandlerRequest& request)
{
    const bool head = request.method == "HEAD";
    if (request.method != "GET" && !head) {
        Json::Value body;
        body["detail"] = "Method Not Allowed";
        HandlerResponse response = jsonResponse(405, body);
        response.setHeader("Allow", "GET, HEAD");
        return response;
    }

    std::vector<std::string> segments = splitPath(request.target);

    try {
        if (segments.size() == 3 && segments[0] == "dl") {
            return handleDownload(request, segments[1], segments[2]);
        }
        if (!head && segments.size() == 2 && segments[0] == "stream" && segments[1] == "stats") {
            return handleStats();
        }
        if (!head && segments.size() == 3 && segments[0] == "stream" && segments[1] == "stats") {
            return handleStreamStats(segments[2]);
        }
        if (!head && segments.size() == 1 && segments[0] == "health") {
            return handleHealth();
        }
    } catch (const Core::StreamException& e) {
        Debug::log("server", request.method, " ", request.target, " from ", request.client_host,
                   ": ", e.httpStatus(), " ", e.what());
        HandlerResponse response = errorResponse(e);
        if (head) {
            response.body.clear();
            response.head_only = true;
        }
        return response;
    }

    Json::Value body;
    body["detail"] = "Not Found";
    return jsonResponse(404, body);
}

HandlerResponse StreamHandler::handleDownload(const HandlerRequest& request,
                                              const std::string& token,
                                              const std::string& name)
{
    Upstream::StreamIdentifier id = IdentifierCodec::decode(token);
    const int64_t chat_id = id.fullChatId();
    Stream::FileLocator locator = m_resolver.resolve(chat_id, id.message_id);
    IdentifierCodec::verifyHash(id, locator);

    Stream::ByteRange range = RangeTranslator::parse(request.range, locator.size);

    HandlerResponse response;
    response.status = range.partial ? 206 : 200;
    response.content_length = range.length();
    response.setHeader("Content-Type", locator.mime_type);
    response.setHeader("Accept-Ranges", "bytes");
    if (range.partial) {
        response.setHeader("Content-Range", RangeTranslator::contentRange(range, locator.size));
    }
    response.setHeader("Content-Disposition", "inline; filename=\"" +
                       dispositionName(locator.file_name.empty() ? name : locator.file_name) + "\"");
    response.setHeader("Cache-Control", "public, max-age=3600, immutable");
    response.setHeader("Access-Control-Allow-Origin", "*");
    response.setHeader("Access-Control-Expose-Headers",
                       "Content-Length, Content-Range, Accept-Ranges, Content-Disposition, X-Stream-Id");

    if (request.method == "HEAD") {
        response.head_only = true;
        return response;
    }

    Stream::FetchPlan plan = RangeTranslator::plan(range, m_chunk_size);
    size_t client_index = m_pool.select(locator.dc_id);

    double now = Core::System::unixTime();
    Stream::StreamRecord record;
    record.chat_id = chat_id;
    record.message_id = id.message_id;
    record.client_index = client_index;
    record.target_dc = locator.dc_id;
    record.start_time = now;
    record.last_update = now;
    record.range_start = range.start;
    record.range_end = range.end;
    record.file_name = locator.file_name;
    record.request_path = request.target;
    record.client_host = request.client_host;
    std::string stream_id = m_registry.registerStream(std::move(record));

    Debug::log("server", "Stream ", stream_id, ": message ", id.message_id, " bytes ", range.start, "-",
               range.end, "/", locator.size, " on connection ", client_index, " for ", request.client_host);

    response.engine = std::make_unique<Stream::PrefetchEngine>(m_pool, client_index, locator, plan,
                                                                m_engine_options, &m_registry, stream_id,
                                                                m_usage);
    response.engine->start();
    response.setHeader("X-Stream-Id", stream_id);
    return response;
}

HandlerResponse StreamHandler::handleStats()
{
    m_registry.prune(Core::System::unixTime());
    return jsonResponse(200, StatsSerializer::statsToJson(m_registry.listActive(),
                                                          m_registry.listRecent(), m_pool));
}

HandlerResponse StreamHandler::handleStreamStats(const std::string& id)
{
    auto record = m_registry.get(id);
    if (!record) {
        Json::Value body;
        body["detail"] = "Stream not found";
        return jsonResponse(404, body);
    }
    return jsonResponse(200, StatsSerializer::recordToJson(*record));
}

HandlerResponse StreamHandler::handleHealth()
{
    Json::Value body;
    body["status"] = "ok";
    body["version"] = TGSTREAM_VERSION;
    body["connections"] = Json::UInt64(m_pool.size());
    body["active_streams"] = Json::UInt64(m_registry.activeCount());
    body["uptime"] = Json::Int64(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - m_started).count());
    return jsonResponse(200, body);
}

} // namespace Server
} // namespace TGStream
