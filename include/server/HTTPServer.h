/*
 * HTTPServer.h - Blocking HTTP/1.1 front end
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef HTTPSERVER_H
#define HTTPSERVER_H

// No direct includes - all includes should be in tgstream.h

namespace TGStream {
namespace Server {

/**
 * @brief HTTP/1.1 listener, one thread per client connection
 *
 * Accepting runs on an io_context; each accepted socket is then served
 * with blocking Beast reads and writes on its own thread. Streamed bodies
 * are written chunk by chunk as the engine produces them, so a client that
 * reads slowly stalls only its own engine.
 */
class HTTPServer {
public:
    /**
     * @throws boost::system::system_error if the address cannot be bound
     */
    HTTPServer(StreamHandler& handler, const std::string& address, uint16_t port, size_t max_connections);
    ~HTTPServer();

    HTTPServer(const HTTPServer&) = delete;
    HTTPServer& operator=(const HTTPServer&) = delete;

    /**
     * @brief Serve until stop() is called, then wait for open connections
     */
    void run();

    /**
     * @brief Stop accepting and shut down open connections (any thread)
     */
    void stop();

    uint16_t boundPort() const;
    size_t openConnections() const { return m_connections.load(); }

private:
    void doAccept();
    void session(boost::asio::ip::tcp::socket socket);
    bool writeSimple(boost::asio::ip::tcp::socket& socket, HandlerResponse& response,
                     unsigned version, bool keep_alive);
    bool writeStreamed(boost::asio::ip::tcp::socket& socket, HandlerResponse& response,
                       unsigned version, bool keep_alive);

    StreamHandler& m_handler;
    boost::asio::io_context m_ioc;
    boost::asio::ip::tcp::acceptor m_acceptor;
    size_t m_max_connections;
    std::atomic<bool> m_stopping{false};
    std::atomic<size_t> m_connections{0};

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::set<int> m_open_sockets;
};

} // namespace Server
} // namespace TGStream

#endif // HTTPSERVER_H
