/*
 * Config.h - Gateway configuration (file + command line)
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef CONFIG_H
#define CONFIG_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Core {

/**
 * @brief How the client pool treats the file's data center
 */
enum class AffinityPolicy {
    Advisory,   ///< Logged only, global minimum load always wins
    Prefer      ///< Minimum load among matching connections, global minimum otherwise
};

/**
 * @brief One MTProto gateway process holding one authorized session
 */
struct GatewayEndpoint {
    int dc_id = 0;
    std::string url;
};

/**
 * @brief Runtime settings
 *
 * Defaults are usable for a single local gateway. A key=value file is read
 * first, command line options are applied on top with set().
 */
struct Config {
    // HTTP listener
    std::string listen_address = "0.0.0.0";
    uint16_t port = 8080;
    size_t max_connections = 256;

    // Streaming engine
    uint32_t chunk_size = 1024 * 1024;
    size_t parallelism = 4;
    size_t prefetch = 8;
    int max_transient_retries = 5;
    int fetch_timeout = 30;             // seconds, per chunk request

    // Stream registry
    int prune_seconds = 3;
    size_t recent_capacity = 100;

    // Client pool
    AffinityPolicy dc_affinity = AffinityPolicy::Advisory;
    std::vector<GatewayEndpoint> gateways;

    // File resolver
    size_t resolver_cache_size = 256;

    // Usage accounting
    std::string usage_report_url;
    uint64_t usage_report_threshold = 8ull * 1024 * 1024;
    size_t usage_queue_capacity = 1024;

    // Logging
    std::string log_file;
    std::vector<std::string> debug_channels;

    /**
     * @brief Read a key=value configuration file
     *
     * Blank lines and lines starting with '#' are ignored. Unknown keys are
     * rejected so typos do not silently fall back to defaults.
     * @param path File to read
     * @throws ConfigException if the file cannot be opened or a value is bad
     */
    void loadFile(const std::string& path);

    /**
     * @brief Apply one setting
     * @param key Setting name as used in the configuration file
     * @param value Raw value
     * @throws ConfigException on unknown keys and unparsable values
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Check cross-field constraints after everything is loaded
     * @throws ConfigException if the configuration cannot run
     */
    void validate() const;

    static AffinityPolicy parseAffinity(const std::string& value);
    static const char* affinityName(AffinityPolicy policy);
    static GatewayEndpoint parseGateway(const std::string& value);
};

} // namespace Core
} // namespace TGStream

#endif // CONFIG_H
