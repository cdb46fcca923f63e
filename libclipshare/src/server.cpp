/**
 * @file server.cpp
 * @brief Boost.Beast web server implementation
 */

#include "clipshare/server.h"
#include "clipshare/logging.h"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <thread>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace clipshare {

namespace {

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

/// Idle HTTP connections are dropped after this long
constexpr std::chrono::seconds HTTP_IDLE_TIMEOUT{30};

/// Messages queued for one WebSocket client before it counts as stuck
constexpr size_t MAX_SEND_QUEUE = 64;

constexpr const char *MIME_JSON = "application/json";
constexpr const char *MIME_HTML = "text/html";
constexpr const char *MIME_JAVASCRIPT = "application/javascript";

Response make_response(const Request &req, http::status status,
                       const char *content_type, std::string body) {
  Response res{status, req.version()};
  res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
  res.set(http::field::content_type, content_type);
  res.keep_alive(req.keep_alive());
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

Response json_response(const Request &req, std::string body,
                       http::status status = http::status::ok) {
  return make_response(req, status, MIME_JSON, std::move(body));
}

std::string request_path(beast::string_view target) {
  std::string path(target.data(), target.size());
  auto query = path.find('?');
  if (query != std::string::npos) {
    path.resize(query);
  }
  return path;
}

} // namespace

class HttpSession;
class WebSocketSession;

// ============================================================================
// Server State
// ============================================================================

/// State shared by the accept loop, the sessions and the handlers
struct ServerCore {
  ServerCore(BroadcastHub &h, std::filesystem::path dir)
      : hub(h), frontend_dir(std::move(dir)) {}

  BroadcastHub &hub;
  std::filesystem::path frontend_dir;

  // Guards start/stop
  mutable std::mutex lifecycle_mutex;
  std::atomic<bool> running{false};
  std::atomic<bool> accepting{false};
  std::atomic<uint16_t> bound_port{0};

  // Orders WebSocket registration against stop()
  std::mutex accept_mutex;

  std::unique_ptr<net::io_context> ioc;
  std::unique_ptr<tcp::acceptor> acceptor;
  std::unique_ptr<net::thread_pool> workers;
  std::thread io_thread;

  std::mutex cache_mutex;
  std::map<std::string, std::string> frontend_cache;

  void do_accept();
  void on_accept(beast::error_code ec, tcp::socket socket);

  /// Build the response for a plain HTTP request (runs on a worker)
  Response handle_request(const Request &req);

  std::string frontend_file(const std::string &name);
  ServerStatus status() const;
};

class WebServer::Impl : public ServerCore {
public:
  using ServerCore::ServerCore;
};

// ============================================================================
// WebSocket Session
// ============================================================================

class WebSocketSession : public LiveClient,
                         public std::enable_shared_from_this<WebSocketSession> {
public:
  WebSocketSession(tcp::socket &&socket, ServerCore &server)
      : ws_(std::move(socket)), server_(server) {}

  void run(Request req) {
    ws_.set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(
        websocket::stream_base::decorator([](websocket::response_type &res) {
          res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
        }));
    ws_.read_message_max(MAX_REQUEST_BODY_SIZE);
    ws_.async_accept(req, beast::bind_front_handler(&WebSocketSession::on_accept,
                                                    shared_from_this()));
  }

  Result<void> send_text(const std::string &message) override {
    if (!open_) {
      return Error(ErrorCode::ConnectionClosed, "WebSocket is closed");
    }
    if (pending_.fetch_add(1) >= MAX_SEND_QUEUE) {
      pending_.fetch_sub(1);
      return Error(ErrorCode::NetworkSendError, "WebSocket send queue full");
    }
    net::post(ws_.get_executor(), [self = shared_from_this(), message] {
      self->enqueue(message);
    });
    return Result<void>::ok();
  }

  void close() override {
    open_ = false;
    net::post(ws_.get_executor(), [self = shared_from_this()] {
      self->close_requested_ = true;
      if (self->queue_.empty()) {
        self->do_close();
      }
    });
  }

private:
  void on_accept(beast::error_code ec) {
    if (ec) {
      CLIPSHARE_LOG_DEBUG("WebSocket handshake failed: {}", ec.message());
      return;
    }
    bool registered = false;
    {
      std::lock_guard<std::mutex> lock(server_.accept_mutex);
      if (server_.accepting) {
        open_ = true;
        server_.hub.register_client(shared_from_this());
        registered = true;
      }
    }
    if (!registered) {
      do_close();
      return;
    }
    do_read();
  }

  void do_read() {
    ws_.async_read(buffer_,
                   beast::bind_front_handler(&WebSocketSession::on_read,
                                             shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t) {
    if (ec) {
      if (ec != websocket::error::closed && ec != net::error::operation_aborted) {
        CLIPSHARE_LOG_ERROR("ws connection closed with exception {}",
                            ec.message());
      }
      detach();
      return;
    }

    if (ws_.got_text()) {
      auto reply =
          server_.hub.handle_message(beast::buffers_to_string(buffer_.data()));
      if (reply) {
        ++pending_;
        enqueue(*reply);
      }
    }
    buffer_.consume(buffer_.size());
    do_read();
  }

  // Runs on the session strand
  void enqueue(std::string message) {
    queue_.push_back(std::move(message));
    if (queue_.size() > 1) {
      return;
    }
    do_write();
  }

  void do_write() {
    ws_.text(true);
    ws_.async_write(net::buffer(queue_.front()),
                    beast::bind_front_handler(&WebSocketSession::on_write,
                                              shared_from_this()));
  }

  void on_write(beast::error_code ec, std::size_t) {
    if (ec) {
      CLIPSHARE_LOG_ERROR("Failed to send to websocket: {}", ec.message());
      queue_.clear();
      pending_ = 0;
      detach();
      return;
    }

    queue_.pop_front();
    --pending_;
    if (!queue_.empty()) {
      do_write();
    } else if (close_requested_) {
      do_close();
    }
  }

  void do_close() {
    if (!ws_.is_open()) {
      beast::error_code ec;
      beast::get_lowest_layer(ws_).socket().close(ec);
      return;
    }
    ws_.async_close(websocket::close_code::going_away,
                    [self = shared_from_this()](beast::error_code) {});
  }

  void detach() {
    open_ = false;
    server_.hub.unregister_client(this);
  }

  websocket::stream<beast::tcp_stream> ws_;
  ServerCore &server_;
  beast::flat_buffer buffer_;

  std::deque<std::string> queue_;
  std::atomic<size_t> pending_{0};
  std::atomic<bool> open_{false};
  bool close_requested_ = false;
};

// ============================================================================
// HTTP Session
// ============================================================================

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket &&socket, ServerCore &server)
      : stream_(std::move(socket)), server_(server) {}

  void run() {
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::do_read,
                                            shared_from_this()));
  }

private:
  void do_read() {
    parser_.emplace();
    parser_->body_limit(MAX_REQUEST_BODY_SIZE);
    stream_.expires_after(HTTP_IDLE_TIMEOUT);
    http::async_read(stream_, buffer_, *parser_,
                     beast::bind_front_handler(&HttpSession::on_read,
                                               shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
      do_close();
      return;
    }
    if (ec == http::error::body_limit) {
      Request req;
      req.keep_alive(false);
      send(json_response(req, serialize_failure("Request body too large"),
                         http::status::payload_too_large));
      return;
    }
    if (ec) {
      CLIPSHARE_LOG_DEBUG("HTTP read error: {}", ec.message());
      return;
    }

    if (!server_.accepting) {
      do_close();
      return;
    }

    Request req = parser_->release();

    if (websocket::is_upgrade(req) && request_path(req.target()) == "/api/ws") {
      stream_.expires_never();
      std::make_shared<WebSocketSession>(stream_.release_socket(), server_)
          ->run(std::move(req));
      return;
    }

    // Clipboard access may block on the helper, keep it off the I/O thread
    net::post(*server_.workers, [self = shared_from_this(),
                                 req = std::move(req)]() mutable {
      Response res = self->server_.handle_request(req);
      net::post(self->stream_.get_executor(),
                [self, res = std::move(res)]() mutable {
                  self->send(std::move(res));
                });
    });
  }

  void send(Response res) {
    bool close = res.need_eof();
    response_ = std::make_shared<Response>(std::move(res));
    http::async_write(stream_, *response_,
                      beast::bind_front_handler(&HttpSession::on_write,
                                                shared_from_this(), close));
  }

  void on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
      CLIPSHARE_LOG_DEBUG("HTTP write error: {}", ec.message());
      return;
    }
    if (close) {
      do_close();
      return;
    }
    response_.reset();
    do_read();
  }

  void do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream stream_;
  ServerCore &server_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  std::shared_ptr<Response> response_;
};

// ============================================================================
// Accept Loop
// ============================================================================

void ServerCore::do_accept() {
  acceptor->async_accept(
      net::make_strand(*ioc),
      [this](beast::error_code ec, tcp::socket socket) {
        on_accept(ec, std::move(socket));
      });
}

void ServerCore::on_accept(beast::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted || !accepting) {
    return;
  }
  if (ec) {
    CLIPSHARE_LOG_ERROR("Accept failed: {}", ec.message());
  } else {
    std::make_shared<HttpSession>(std::move(socket), *this)->run();
  }
  do_accept();
}

// ============================================================================
// Routing
// ============================================================================

Response ServerCore::handle_request(const Request &req) {
  const std::string path = request_path(req.target());
  const auto method = req.method();

  try {
    if (path == "/" && method == http::verb::get) {
      return make_response(req, http::status::ok, MIME_HTML,
                           frontend_file("index.html"));
    }

    if (path == "/i18n.js" && method == http::verb::get) {
      return make_response(req, http::status::ok, MIME_JAVASCRIPT,
                           frontend_file("i18n.js"));
    }

    if (path == "/api/clipboard") {
      if (method == http::verb::get) {
        return json_response(req, serialize_clipboard(hub.handle_read()));
      }

      if (method == http::verb::post) {
        auto request = parse_write_request(req.body());
        if (request.is_error()) {
          CLIPSHARE_LOG_ERROR("set_clipboard error: {}",
                              request.error().to_string());
          return json_response(req,
                               serialize_failure(request.error().message));
        }

        const auto &w = request.value();
        auto result = hub.handle_write(w.content, w.mime_type, w.is_base64);
        if (result.is_error()) {
          return json_response(req, serialize_failure(result.error().message));
        }
        return json_response(req, serialize_success(true));
      }

      return json_response(req, serialize_failure("Method not allowed"),
                           http::status::method_not_allowed);
    }

    if (path == "/api/status" && method == http::verb::get) {
      return json_response(req, serialize_status(status()));
    }

    if (path == "/api/ws") {
      return json_response(req, serialize_failure("WebSocket upgrade required"),
                           http::status::bad_request);
    }
  } catch (const std::exception &ex) {
    CLIPSHARE_LOG_ERROR("Request handler error: {}", ex.what());
    return json_response(req, serialize_failure(ex.what()),
                         http::status::internal_server_error);
  }

  return json_response(req, serialize_failure("Not found"),
                       http::status::not_found);
}

std::string ServerCore::frontend_file(const std::string &name) {
  std::lock_guard<std::mutex> lock(cache_mutex);

  auto it = frontend_cache.find(name);
  if (it != frontend_cache.end()) {
    return it->second;
  }

  std::ifstream file(frontend_dir / name, std::ios::binary);
  if (!file) {
    CLIPSHARE_LOG_WARNING("Frontend file missing: {}",
                          (frontend_dir / name).string());
    return "";
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return frontend_cache.emplace(name, buffer.str()).first->second;
}

ServerStatus ServerCore::status() const {
  ServerStatus s;
  s.running = running;
  s.ip = get_local_ip();
  s.port = bound_port;
  s.url = make_server_url(s.ip, s.port);
  s.clipboard_available = hub.adapter().is_available();
  return s;
}

// ============================================================================
// WebServer
// ============================================================================

WebServer::WebServer(BroadcastHub &hub, std::filesystem::path frontend_dir)
    : impl_(std::make_unique<Impl>(hub, std::move(frontend_dir))) {}

WebServer::~WebServer() { stop(); }

Result<void> WebServer::start(uint16_t port, const std::string &address) {
  std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);

  if (impl_->running) {
    CLIPSHARE_LOG_WARNING("WebServer already running");
    return Result<void>::ok();
  }

  CLIPSHARE_LOG_INFO("Starting web server on port {}", port);

  beast::error_code ec;
  auto bind_address = net::ip::make_address(address, ec);
  if (ec) {
    return Error(ErrorCode::InvalidArgument, "Invalid bind address", address);
  }
  tcp::endpoint endpoint{bind_address, port};

  auto ioc = std::make_unique<net::io_context>(1);
  auto acceptor = std::make_unique<tcp::acceptor>(net::make_strand(*ioc));

  auto fail = [&](const char *what) -> Error {
    CLIPSHARE_LOG_ERROR("Failed to start server: {}: {}", what, ec.message());
    return Error(ErrorCode::BindFailed, what, ec.message());
  };

  acceptor->open(endpoint.protocol(), ec);
  if (ec) {
    return fail("open");
  }
  acceptor->set_option(net::socket_base::reuse_address(true), ec);
  if (ec) {
    return fail("set_option");
  }
  acceptor->bind(endpoint, ec);
  if (ec) {
    return fail("bind");
  }
  acceptor->listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    return fail("listen");
  }

  impl_->bound_port = acceptor->local_endpoint(ec).port();
  impl_->ioc = std::move(ioc);
  impl_->acceptor = std::move(acceptor);
  impl_->workers = std::make_unique<net::thread_pool>(WORKER_THREADS);
  impl_->accepting = true;
  impl_->running = true;

  impl_->do_accept();
  impl_->io_thread = std::thread([io = impl_->ioc.get()] { io->run(); });

  CLIPSHARE_LOG_INFO("Web server listening on {}:{}", address,
                     impl_->bound_port.load());
  return Result<void>::ok();
}

void WebServer::stop() {
  std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);

  if (!impl_->running) {
    return;
  }

  CLIPSHARE_LOG_INFO("Stopping web server");
  {
    std::lock_guard<std::mutex> accept_lock(impl_->accept_mutex);
    impl_->accepting = false;
  }

  net::post(impl_->acceptor->get_executor(), [acceptor = impl_->acceptor.get()] {
    beast::error_code ec;
    acceptor->close(ec);
  });

  impl_->hub.close_all();

  // Drain in-flight handlers; new ones are refused once accepting is false
  impl_->workers->join();

  impl_->ioc->stop();
  if (impl_->io_thread.joinable()) {
    impl_->io_thread.join();
  }

  impl_->acceptor.reset();
  impl_->workers.reset();
  impl_->ioc.reset();

  impl_->bound_port = 0;
  impl_->running = false;
}

bool WebServer::is_running() const { return impl_->running; }

uint16_t WebServer::port() const { return impl_->bound_port; }

ServerStatus WebServer::status() const { return impl_->status(); }

// ============================================================================
// Local Address
// ============================================================================

std::string get_local_ip() {
  net::io_context ctx;
  net::ip::udp::socket socket(ctx);
  beast::error_code ec;

  socket.connect(
      net::ip::udp::endpoint(net::ip::make_address("8.8.8.8", ec), 80), ec);
  if (ec) {
    return "127.0.0.1";
  }

  auto endpoint = socket.local_endpoint(ec);
  if (ec) {
    return "127.0.0.1";
  }
  return endpoint.address().to_string();
}

} // namespace clipshare
