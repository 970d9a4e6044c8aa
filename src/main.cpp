/*
 * main.cpp - contains main(), mostly.
 * This file is part of TGStream.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
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

#include "tgstream.h"
#include <getopt.h>
#include <csignal>

using namespace TGStream;

static void usage(const char* argv0)
{
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "  -c, --config FILE        read key=value settings from FILE\n"
              << "  -l, --listen ADDRESS     listen address (default 0.0.0.0)\n"
              << "  -p, --port PORT          listen port (default 8080)\n"
              << "  -g, --gateway DC@URL     MTProto gateway, repeatable\n"
              << "  -C, --chunk-size BYTES   upstream chunk size (default 1048576)\n"
              << "  -P, --parallelism N      concurrent fetches per stream\n"
              << "  -w, --prefetch N         read-ahead window in chunks\n"
              << "  -a, --dc-affinity MODE   advisory or prefer\n"
              << "  -u, --usage-url URL      POST usage deltas to URL\n"
              << "  -L, --logfile FILE       write log output to FILE\n"
              << "  -d, --debug CHANNELS     comma separated debug channels, or all\n"
              << "  -v, --version            print version and exit\n"
              << "  -h, --help               print this help and exit\n";
}

int main(int argc, char *argv[]) {
    // Command line settings are applied after the configuration file so
    // they win over it.
    std::vector<std::pair<std::string, std::string>> overrides;
    std::string config_file;

    static const struct option long_options[] = {
        {"config", required_argument, 0, 'c'},
        {"listen", required_argument, 0, 'l'},
        {"port", required_argument, 0, 'p'},
        {"gateway", required_argument, 0, 'g'},
        {"chunk-size", required_argument, 0, 'C'},
        {"parallelism", required_argument, 0, 'P'},
        {"prefetch", required_argument, 0, 'w'},
        {"dc-affinity", required_argument, 0, 'a'},
        {"usage-url", required_argument, 0, 'u'},
        {"logfile", required_argument, 0, 'L'},
        {"debug", required_argument, 0, 'd'},
        {"version", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "c:l:p:g:C:P:w:a:u:L:d:vh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'c': config_file = optarg; break;
            case 'l': overrides.emplace_back("listen_address", optarg); break;
            case 'p': overrides.emplace_back("port", optarg); break;
            case 'g': overrides.emplace_back("gateway", optarg); break;
            case 'C': overrides.emplace_back("chunk_size", optarg); break;
            case 'P': overrides.emplace_back("parallelism", optarg); break;
            case 'w': overrides.emplace_back("prefetch", optarg); break;
            case 'a': overrides.emplace_back("dc_affinity", optarg); break;
            case 'u': overrides.emplace_back("usage_report_url", optarg); break;
            case 'L': overrides.emplace_back("log_file", optarg); break;
            case 'd': overrides.emplace_back("debug", optarg); break;
            case 'v':
                std::cout << "TGStream " << TGSTREAM_VERSION << " - " << TGSTREAM_MAINTAINER << std::endl;
                return 0;
            case 'h':
                usage(argv[0]);
                return 0;
            case '?': // Invalid option
                return 1; // getopt_long already prints an error message.
        }
    }
    if (optind < argc) {
        std::cerr << argv[0] << ": unexpected argument '" << argv[optind] << "'" << std::endl;
        return 1;
    }

    Core::Config config;
    try {
        if (!config_file.empty()) {
            config.loadFile(config_file);
        }
        bool cli_gateways = false;
        for (const auto& [key, value] : overrides) {
            // Gateways given on the command line replace the file's list
            if (key == "gateway" && !cli_gateways) {
                config.gateways.clear();
                cli_gateways = true;
            }
            config.set(key, value);
        }
        config.validate();
    } catch (const Core::ConfigException& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }

    if (!Debug::init(config.log_file, config.debug_channels)) {
        std::cerr << "TGStream: cannot open log file " << config.log_file << ", logging to stdout" << std::endl;
    }

    // Streaming threads write to sockets the client may have closed
    std::signal(SIGPIPE, SIG_IGN);

    // Every thread started from here on inherits the blocked mask; the
    // watcher is the only one that sees SIGINT and SIGTERM.
    Core::SignalWatcher signals({SIGINT, SIGTERM});

    int status = 0;
    try {
        Stream::ClientPool pool(config.dc_affinity);
        for (const auto& gateway : config.gateways) {
            pool.add(std::make_shared<Upstream::GatewayChunkSource>(gateway.url, gateway.dc_id,
                                                                    config.fetch_timeout),
                     gateway.dc_id);
        }

        Upstream::GatewayFileResolver resolver(config.gateways, config.resolver_cache_size, config.fetch_timeout);
        Stream::StreamRegistry registry(std::chrono::seconds(config.prune_seconds), config.recent_capacity);
        Stream::UsageReporter usage(config.usage_report_url.empty()
                                        ? Stream::UsageReporter::logSink()
                                        : Stream::UsageReporter::httpSink(config.usage_report_url,
                                                                          config.fetch_timeout),
                                    config.usage_queue_capacity);

        Server::StreamHandler handler(pool, resolver, registry, &usage, config);
        Server::HTTPServer server(handler, config.listen_address, config.port, config.max_connections);

        Debug::log("server", "TGStream ", TGSTREAM_VERSION, " serving ", pool.size(), " connections, chunk ",
                   config.chunk_size, ", parallelism ", config.parallelism, ", prefetch ", config.prefetch,
                   ", dc affinity ", Core::Config::affinityName(config.dc_affinity));
        std::cout << "TGStream listening on " << config.listen_address << ":" << server.boundPort() << std::endl;

        signals.start([&server](int sig) {
            Debug::log("server", "Shutting down on signal ", sig);
            server.stop();
        });
        try {
            server.run();
        } catch (const boost::system::system_error&) {
            signals.release();
            throw;
        }
        // run() can end without a signal; the watcher must not outlive the server
        signals.release();
        usage.flush();
    } catch (const boost::system::system_error& e) {
        Debug::error("server", "Network setup failed: ", e.what());
        std::cerr << "TGStream: " << e.what() << std::endl;
        status = 1;
    }

    HTTPClient::closeAllConnections();
    Debug::shutdown();
    return status;
}
