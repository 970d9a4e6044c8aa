/*
 * HTTPServer.cpp - Blocking HTTP/1.1 front end
 * This file is part of TGStream.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * TGStream is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "tgstream.h"
#include <sys/socket.h>

namespace TGStream {
namespace Server {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

HTTPServer::HTTPServer(StreamHandler& handler, const std::string& address, uint16_t port, size_t max_connections)
    : m_handler(handler)
    , m_acceptor(m_ioc)
    , m_max_connections(max_connections)
{
    tcp::endpoint endpoint(asio::ip::make_address(address), port);
    m_acceptor.open(endpoint.protocol());
    m_acceptor.set_option(asio::socket_base::reuse_address(true));
    m_acceptor.bind(endpoint);
    m_acceptor.listen(asio::socket_base::max_listen_connections);
    Debug::log("server", "Listening on ", address, ":", boundPort());
}

HTTPServer::~HTTPServer()
{
    stop();
}

uint16_t HTTPServer::boundPort() const
{
    beast::error_code ec;
    auto endpoint = m_acceptor.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void HTTPServer::run()
{
    doAccept();
    m_ioc.run();

    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return m_connections.load() == 0; });
    Debug::log("server", "All connections closed");
}

void HTTPServer::stop()
{
    if (m_stopping.exchange(true)) {
        return;
    }
    asio::post(m_ioc, [this] {
        beast::error_code ec;
        m_acceptor.close(ec);
    });

    // Wake sessions blocked in reads; their threads then wind down
    std::lock_guard<std::mutex> lock(m_mutex);
    for (int fd : m_open_sockets) {
        ::shutdown(fd, SHUT_RDWR);
    }
    Debug::log("server", "Stopping, ", m_open_sockets.size(), " connections open");
}

void HTTPServer::doAccept()
{
    m_acceptor.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (m_stopping) {
            return;
        }
        if (ec) {
            Debug::error("server", "Accept failed: ", ec.message());
        } else {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_connections.fetch_add(1);
                m_open_sockets.insert(socket.native_handle());
            }
            std::thread(&HTTPServer::session, this, std::move(socket)).detach();
        }
        doAccept();
    });
}

void HTTPServer::session(tcp::socket socket)
{
    Core::System::setThisThreadName("tgs-http");

    beast::error_code ec;
    std::string client_host = "unknown";
    auto remote = socket.remote_endpoint(ec);
    if (!ec) {
        client_host = remote.address().to_string();
    }

    if (m_connections.load() > m_max_connections) {
        Debug::log("server", "Connection limit reached, refusing ", client_host);
        Json::Value body;
        body["detail"] = "Too many connections";
        HandlerResponse busy = StreamHandler::jsonResponse(503, body);
        writeSimple(socket, busy, 11, false);
    } else {
        beast::flat_buffer buffer;
        while (!m_stopping) {
            http::request_parser<http::string_body> parser;
            parser.body_limit(64 * 1024);
            http::read(socket, buffer, parser, ec);
            if (ec == http::error::end_of_stream) {
                break;
            }
            if (ec) {
                DEBUG_LOG_LAZY("server", "Read from ", client_host, " failed: ", ec.message());
                break;
            }
            const auto& req = parser.get();

            HandlerRequest request;
            request.method = std::string(req.method_string());
            request.target = std::string(req.target());
            request.client_host = client_host;
            auto range = req.find(http::field::range);
            if (range != req.end()) {
                request.range = std::string(range->value());
            }

            HandlerResponse response;
            try {
                response = m_handler.handle(request);
            } catch (const std::exception& e) {
                Debug::error("server", request.method, " ", request.target, " failed: ", e.what());
                Json::Value body;
                body["detail"] = "Internal Server Error";
                response = StreamHandler::jsonResponse(500, body);
            }

            bool keep_alive = req.keep_alive();
            bool ok = response.engine
                ? writeStreamed(socket, response, req.version(), keep_alive)
                : writeSimple(socket, response, req.version(), keep_alive);
            if (!ok || !keep_alive) {
                break;
            }
        }
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_open_sockets.erase(socket.native_handle());
        socket.close(ec);
        m_connections.fetch_sub(1);
    }
    m_cv.notify_all();
}

bool HTTPServer::writeSimple(tcp::socket& socket, HandlerResponse& response, unsigned version, bool keep_alive)
{
    beast::error_code ec;
    if (response.head_only) {
        http::response<http::empty_body> out{static_cast<http::status>(response.status), version};
        out.set(http::field::server, TGSTREAM_USER_AGENT);
        for (const auto& [name, value] : response.headers) {
            out.set(name, value);
        }
        out.content_length(response.content_length);
        out.keep_alive(keep_alive);
        http::write(socket, out, ec);
    } else {
        http::response<http::string_body> out{static_cast<http::status>(response.status), version};
        out.set(http::field::server, TGSTREAM_USER_AGENT);
        for (const auto& [name, value] : response.headers) {
            out.set(name, value);
        }
        out.body() = std::move(response.body);
        out.keep_alive(keep_alive);
        out.prepare_payload();
        http::write(socket, out, ec);
    }
    if (ec) {
        DEBUG_LOG_LAZY("server", "Write failed: ", ec.message());
        return false;
    }
    return true;
}

bool HTTPServer::writeStreamed(tcp::socket& socket, HandlerResponse& response, unsigned version, bool keep_alive)
{
    Stream::PrefetchEngine& engine = *response.engine;

    http::response<http::buffer_body> out{static_cast<http::status>(response.status), version};
    out.set(http::field::server, TGSTREAM_USER_AGENT);
    for (const auto& [name, value] : response.headers) {
        out.set(name, value);
    }
    out.content_length(response.content_length);
    out.keep_alive(keep_alive);
    out.body().data = nullptr;
    out.body().more = true;

    http::response_serializer<http::buffer_body> sr{out};
    beast::error_code ec;
    http::write_header(socket, sr, ec);
    if (ec) {
        Debug::log("server", "Stream ", engine.streamId(), ": client went away before headers: ", ec.message());
        engine.cancel();
        return false;
    }

    std::vector<uint8_t> chunk;
    try {
        while (engine.nextChunk(chunk)) {
            out.body().data = chunk.data();
            out.body().size = chunk.size();
            out.body().more = true;
            http::write(socket, sr, ec);
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            if (ec) {
                Debug::log("server", "Stream ", engine.streamId(), ": client disconnected after ",
                           engine.deliveredBytes(), " bytes: ", ec.message());
                engine.cancel();
                return false;
            }
        }
    } catch (const Core::UpstreamFatalException& e) {
        // Headers are out already; closing is the only way to signal truncation
        Debug::error("server", "Stream ", engine.streamId(), " aborted after ", engine.deliveredBytes(),
                     " bytes: ", e.what());
        return false;
    }

    if (engine.state() != Stream::PrefetchEngine::State::Finished) {
        return false;
    }
    if (engine.deliveredBytes() < response.content_length) {
        // Upstream ended early; the promised Content-Length can only be
        // broken by closing, or the client keeps waiting on this connection
        Debug::error("server", "Stream ", engine.streamId(), " ended after ", engine.deliveredBytes(),
                     " of ", response.content_length, " bytes, closing connection");
        return false;
    }

    out.body().data = nullptr;
    out.body().more = false;
    http::write(socket, sr, ec);
    if (ec == http::error::need_buffer) {
        ec = {};
    }
    return !ec;
}

} // namespace Server
} // namespace TGStream
