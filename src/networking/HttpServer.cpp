#include "networking/HttpServer.h"

#include "actions/ToolRouter.h"
#include "events/Connection.hpp"
#include "networking/QueryString.h"
#include "relay/Relay.h"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <deque>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <unordered_map>

namespace sessionrelay::networking {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace json = boost::json;
using tcp = asio::ip::tcp;

static constexpr const char* kServerName = "SessionRelay";
static constexpr std::chrono::seconds kRequestTimeout{30};

static std::string error_body(const std::string& message) {
    return json::serialize(json::object{{"error", message}});
}

// Peer went away; not worth a log line.
static bool is_disconnect(beast::error_code ec) {
    return ec == asio::error::eof || ec == asio::error::connection_reset ||
           ec == asio::error::broken_pipe || ec == asio::error::operation_aborted ||
           ec == http::error::end_of_stream;
}

class HttpServer::Impl {
public:
    using Strand = asio::strand<asio::io_context::executor_type>;

    Impl(asio::io_context& ioc,
         const std::string& address,
         unsigned short port,
         relay::Relay& relay,
         actions::ToolRouter& tools)
        : ioc_(ioc),
          acceptor_(ioc, tcp::endpoint(asio::ip::make_address(address), port)),
          relay_(relay),
          tools_(tools) {}

    void start() { do_accept(); }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);

        // Close all clients
        std::unordered_map<ClientId, std::shared_ptr<Client>> clients;
        {
            std::lock_guard<std::mutex> lk(mu_);
            clients.swap(clients_);
        }
        for (auto& [id, c] : clients) {
            c->shutdown();
        }
    }

    unsigned short port() const {
        beast::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

private:
    // One accepted socket. Serves plain request/response exchanges until it
    // hits the stream route, after which it is an events::Connection owned by
    // the relay's registry until CLOSED.
    class Client : public std::enable_shared_from_this<Client>, public events::Connection {
    public:
        Client(Impl& server, tcp::socket socket, Strand strand, ClientId id)
            : server_(server),
              id_(id),
              stream_(std::move(socket)),
              strand_(std::move(strand)),
              heartbeat_(strand_) {}

        void start() {
            asio::dispatch(strand_, [self = shared_from_this()] { self->do_read(); });
        }

        // ---- events::Connection ----

        const events::SessionId& session_id() const noexcept override { return session_id_; }

        // A reader that falls max_queued_frames behind counts as dead.
        bool send(std::string frame) override {
            if (!open_) return false;
            if (queued_.fetch_add(1) >= server_.relay_.options().max_queued_frames) {
                --queued_;
                std::cerr << "[client " << id_ << "] write queue full, dropping stream\n";
                return false;
            }
            asio::post(
                strand_,
                [self = shared_from_this(), frame = std::move(frame)]() mutable {
                    if (!self->open_) return;
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(std::move(frame));
                    if (!writing) self->do_write();
                });
            return true;
        }

        void close() override {
            if (!open_.exchange(false)) return;
            asio::post(
                strand_,
                [self = shared_from_this()] {
                    self->heartbeat_.cancel();
                    beast::error_code ec;
                    self->stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
                    self->stream_.close();
                    self->server_.remove_client(self->id_);

                    if (self->streaming_) {
                        std::cout << "[stream] client " << self->id_ << " left " << self->session_id_ << "\n";
                    }
                });
        }

        // Server shutdown: streaming clients go through the relay so they are deregistered.
        void shutdown() {
            if (streaming_) {
                server_.relay_.disconnect(shared_from_this());
            } else {
                close();
            }
        }

    private:
        void do_read() {
            req_ = {};
            stream_.expires_after(kRequestTimeout);

            http::async_read(
                stream_, buffer_, req_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        self->on_read(ec);
                    }));
        }

        void on_read(beast::error_code ec) {
            if (!open_) return;
            if (ec) {
                if (!is_disconnect(ec) && ec != beast::error::timeout) fail("read", ec);
                return close();
            }
            handle_request();
        }

        void handle_request() {
            const auto raw = req_.target();
            const RequestTarget target = parse_target(std::string_view(raw.data(), raw.size()));

            if (target.path == "/api/mcp/stream") {
                if (req_.method() != http::verb::get) {
                    return send_json(http::status::method_not_allowed, error_body("Method not allowed"));
                }
                return start_stream(target);
            }

            if (target.path == "/api/mcp/tool") {
                if (req_.method() != http::verb::post) {
                    return send_json(http::status::method_not_allowed, error_body("Method not allowed"));
                }
                auto response = server_.tools_.handle(req_.body());
                return send_json(static_cast<http::status>(response.status), std::move(response.body));
            }

            if (target.path == "/api/mcp/stats" && req_.method() == http::verb::get) {
                const auto s = server_.relay_.stats();
                return send_json(http::status::ok, json::serialize(json::object{
                    {"sessions", s.sessions},
                    {"totalEvents", s.total_events},
                    {"connections", s.connections}
                }));
            }

            send_json(http::status::not_found, error_body("Not found"));
        }

        void send_json(http::status status, std::string body) {
            auto res = std::make_shared<http::response<http::string_body>>(status, req_.version());
            res->set(http::field::server, kServerName);
            res->set(http::field::content_type, "application/json");
            res->keep_alive(req_.keep_alive());
            res->body() = std::move(body);
            res->prepare_payload();

            stream_.expires_after(kRequestTimeout);
            http::async_write(
                stream_, *res,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
                        if (ec) {
                            if (!is_disconnect(ec)) self->fail("write", ec);
                            return self->close();
                        }
                        if (!res->keep_alive()) return self->close();
                        self->do_read();
                    }));
        }

        void start_stream(const RequestTarget& target) {
            auto session_id = target.param("sessionId");
            if (!session_id || session_id->empty()) {
                return send_json(http::status::bad_request, error_body("Missing sessionId"));
            }

            // the standard reconnect header stands in when the query has no token
            std::optional<std::string> last_event_id = target.param("lastEventId");
            if (!last_event_id) {
                auto it = req_.find("Last-Event-ID");
                if (it != req_.end()) last_event_id = std::string(it->value().data(), it->value().size());
            }

            session_id_ = std::move(*session_id);
            streaming_ = true;
            stream_.expires_never();

            http::response<http::empty_body> res{http::status::ok, req_.version()};
            res.set(http::field::server, kServerName);
            res.set(http::field::content_type, "text/event-stream");
            res.set(http::field::cache_control, "no-cache, no-transform");
            res.set(http::field::connection, "keep-alive");
            res.set("X-Accel-Buffering", "no");

            std::ostringstream head;
            head << res.base();
            ++queued_;
            write_queue_.push_back(head.str());
            do_write();

            std::optional<std::string_view> token;
            if (last_event_id) token = *last_event_id;

            const auto opened = server_.relay_.connect(shared_from_this(), token);
            if (opened.state != relay::StreamState::Live) return;

            std::cout << "[stream] client " << id_ << " joined " << session_id_
                      << " (lastSeq " << opened.last_seq << ", replayed " << opened.replayed << ")\n";

            arm_heartbeat();
            watch_disconnect();
        }

        void arm_heartbeat() {
            heartbeat_.expires_after(server_.relay_.options().heartbeat_interval);
            heartbeat_.async_wait(
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec || !self->open_) return;
                        if (self->server_.relay_.heartbeat(self)) self->arm_heartbeat();
                    }));
        }

        // An SSE client never sends after its request, so any completion here
        // other than stray bytes means it is gone.
        void watch_disconnect() {
            stream_.async_read_some(
                asio::buffer(drain_),
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (!self->open_) return;
                        if (!ec) return self->watch_disconnect();
                        self->server_.relay_.disconnect(self);
                    }));
        }

        void do_write() {
            asio::async_write(
                stream_,
                asio::buffer(write_queue_.front()),
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_write_failed(ec);

                        self->write_queue_.pop_front();
                        --self->queued_;
                        if (!self->write_queue_.empty()) self->do_write();
                    }));
        }

        void on_write_failed(beast::error_code ec) {
            if (open_ && !is_disconnect(ec)) fail("write", ec);
            write_queue_.clear();

            if (streaming_) {
                server_.relay_.disconnect(shared_from_this());
            } else {
                close();
            }
        }

        void fail(const char* what, beast::error_code ec) {
            std::cerr << "[client " << id_ << "] " << what << ": " << ec.message() << "\n";
        }

        Impl& server_;
        ClientId id_;

        beast::tcp_stream stream_;
        Strand strand_;
        asio::steady_timer heartbeat_;

        beast::flat_buffer buffer_;
        http::request<http::string_body> req_;
        std::deque<std::string> write_queue_;
        std::array<char, 512> drain_{};

        events::SessionId session_id_;
        std::atomic<bool> open_{true};
        std::atomic<bool> streaming_{false};
        std::atomic<std::size_t> queued_{0};  // frames accepted by send() and not yet written
    };

    void do_accept() {
        auto strand = asio::make_strand(ioc_);
        acceptor_.async_accept(
            strand,
            [this, strand](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    std::cerr << "[accept] " << ec.message() << "\n";
                    return do_accept();
                }

                auto id = next_client_id_++;
                auto client = std::make_shared<Client>(*this, std::move(socket), strand, id);

                {
                    std::lock_guard<std::mutex> lk(mu_);
                    clients_[id] = client;
                }

                client->start();
                do_accept();
            });
    }

    void remove_client(ClientId id) {
        std::lock_guard<std::mutex> lk(mu_);
        clients_.erase(id);
    }

private:
    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    relay::Relay& relay_;
    actions::ToolRouter& tools_;

    std::atomic<ClientId> next_client_id_{1};

    std::mutex mu_;
    std::unordered_map<ClientId, std::shared_ptr<Client>> clients_;
};

// ---- HttpServer wrapper ----

HttpServer::HttpServer(asio::io_context& ioc,
                       const std::string& address,
                       unsigned short port,
                       relay::Relay& relay,
                       actions::ToolRouter& tools)
    : impl_(new Impl(ioc, address, port, relay, tools)) {}

void HttpServer::start() { impl_->start(); }
void HttpServer::stop() { impl_->stop(); }

unsigned short HttpServer::port() const { return impl_->port(); }

HttpServer::~HttpServer() = default;

} // namespace sessionrelay::networking
