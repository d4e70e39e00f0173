#pragma once

#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace sessionrelay::relay {
class Relay;
}

namespace sessionrelay::actions {
class ToolRouter;
}

namespace sessionrelay::networking {

using ClientId = std::uint64_t;

// HTTP/1.1 front end:
//   GET  /api/mcp/stream?sessionId=..&lastEventId=..  -> text/event-stream
//   POST /api/mcp/tool                                -> tool call ingress
//   GET  /api/mcp/stats                               -> buffer statistics
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc,
               const std::string& address,
               unsigned short port,
               relay::Relay& relay,
               actions::ToolRouter& tools);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void start();  // start accepting
    void stop();   // stop accepting + close active clients

    // Bound port; differs from the requested one when that was 0.
    unsigned short port() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sessionrelay::networking
