/*
 * Config.cpp - Gateway configuration (file + command line)
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"

namespace TGStream {
namespace Core {

namespace {

std::string trim(const std::string& s)
{
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

uint64_t parseUnsigned(const std::string& key, const std::string& value, uint64_t min, uint64_t max)
{
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigException("Invalid value for " + key + ": '" + value + "'");
    }
    uint64_t result;
    try {
        result = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw ConfigException("Value out of range for " + key + ": " + value);
    }
    if (result < min || result > max) {
        throw ConfigException("Value out of range for " + key + ": " + value +
                              " (expected " + std::to_string(min) + "-" + std::to_string(max) + ")");
    }
    return result;
}

std::vector<std::string> splitList(const std::string& value)
{
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

} // namespace

void Config::loadFile(const std::string& path)
{
    Debug::log("config", "Reading configuration from ", path);
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigException("Cannot open configuration file: " + path);
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t equals = line.find('=');
        if (equals == std::string::npos) {
            throw ConfigException(path + ":" + std::to_string(line_no) + ": expected key=value");
        }

        std::string key = trim(line.substr(0, equals));
        std::string value = trim(line.substr(equals + 1));
        try {
            set(key, value);
        } catch (const ConfigException& e) {
            throw ConfigException(path + ":" + std::to_string(line_no) + ": " + e.what());
        }
    }
}

void Config::set(const std::string& key, const std::string& value)
{
    if (key == "listen_address") {
        if (value.empty()) throw ConfigException("listen_address must not be empty");
        listen_address = value;
    } else if (key == "port") {
        port = static_cast<uint16_t>(parseUnsigned(key, value, 1, 65535));
    } else if (key == "max_connections") {
        max_connections = parseUnsigned(key, value, 1, 65536);
    } else if (key == "chunk_size") {
        // Upstream requires 4 KiB aligned requests, capped at 1 MiB
        uint64_t size = parseUnsigned(key, value, 4096, 1024 * 1024);
        if (size % 4096 != 0) {
            throw ConfigException("chunk_size must be a multiple of 4096: " + value);
        }
        if ((1024 * 1024) % size != 0) {
            throw ConfigException("chunk_size must divide 1048576: " + value);
        }
        chunk_size = static_cast<uint32_t>(size);
    } else if (key == "parallelism") {
        parallelism = parseUnsigned(key, value, 1, 64);
    } else if (key == "prefetch") {
        prefetch = parseUnsigned(key, value, 1, 1024);
    } else if (key == "max_transient_retries") {
        max_transient_retries = static_cast<int>(parseUnsigned(key, value, 0, 100));
    } else if (key == "fetch_timeout") {
        fetch_timeout = static_cast<int>(parseUnsigned(key, value, 1, 3600));
    } else if (key == "prune_seconds") {
        prune_seconds = static_cast<int>(parseUnsigned(key, value, 0, 86400));
    } else if (key == "recent_capacity") {
        recent_capacity = parseUnsigned(key, value, 0, 100000);
    } else if (key == "dc_affinity") {
        dc_affinity = parseAffinity(value);
    } else if (key == "gateway") {
        gateways.push_back(parseGateway(value));
    } else if (key == "resolver_cache_size") {
        resolver_cache_size = parseUnsigned(key, value, 0, 1000000);
    } else if (key == "usage_report_url") {
        usage_report_url = value;
    } else if (key == "usage_report_threshold") {
        usage_report_threshold = parseUnsigned(key, value, 1, UINT64_MAX);
    } else if (key == "usage_queue_capacity") {
        usage_queue_capacity = parseUnsigned(key, value, 1, 1000000);
    } else if (key == "log_file") {
        log_file = value;
    } else if (key == "debug") {
        std::vector<std::string> channels = splitList(value);
        for (const auto& channel : channels) {
            if (!Debug::isKnownChannel(channel)) {
                throw ConfigException("Unknown debug channel: " + channel);
            }
        }
        debug_channels.insert(debug_channels.end(), channels.begin(), channels.end());
    } else {
        throw ConfigException("Unknown configuration key: " + key);
    }
}

void Config::validate() const
{
    if (gateways.empty()) {
        throw ConfigException("At least one gateway must be configured (gateway=<dc>@<url>)");
    }
    if (prefetch < parallelism) {
        throw ConfigException("prefetch (" + std::to_string(prefetch) +
                              ") must not be smaller than parallelism (" +
                              std::to_string(parallelism) + ")");
    }
}

AffinityPolicy Config::parseAffinity(const std::string& value)
{
    if (value == "advisory") return AffinityPolicy::Advisory;
    if (value == "prefer") return AffinityPolicy::Prefer;
    throw ConfigException("dc_affinity must be 'advisory' or 'prefer', got '" + value + "'");
}

const char* Config::affinityName(AffinityPolicy policy)
{
    switch (policy) {
        case AffinityPolicy::Advisory: return "advisory";
        case AffinityPolicy::Prefer: return "prefer";
    }
    return "unknown";
}

GatewayEndpoint Config::parseGateway(const std::string& value)
{
    size_t at = value.find('@');
    if (at == std::string::npos || at == 0 || at + 1 >= value.size()) {
        throw ConfigException("gateway must be <dc>@<url>, got '" + value + "'");
    }
    GatewayEndpoint endpoint;
    endpoint.dc_id = static_cast<int>(parseUnsigned("gateway", value.substr(0, at), 1, 1000));
    endpoint.url = value.substr(at + 1);
    while (!endpoint.url.empty() && endpoint.url.back() == '/') {
        endpoint.url.pop_back();
    }
    if (endpoint.url.compare(0, 7, "http://") != 0 && endpoint.url.compare(0, 8, "https://") != 0) {
        throw ConfigException("gateway URL must be http:// or https://, got '" + endpoint.url + "'");
    }
    return endpoint;
}

} // namespace Core
} // namespace TGStream
