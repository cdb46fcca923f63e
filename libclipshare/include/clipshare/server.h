/**
 * @file server.h
 * @brief HTTP and WebSocket front end
 *
 * Routes:
 * - `GET /`               frontend index.html
 * - `GET /i18n.js`        frontend translations
 * - `GET /api/clipboard`  current clipboard snapshot
 * - `POST /api/clipboard` replace clipboard content
 * - `GET /api/status`     server status
 * - `GET /api/ws`         WebSocket push channel (ping/pong keep-alive)
 *
 * Network I/O runs on a single io_context thread; clipboard handlers run
 * on a worker pool so a slow helper process never stalls the network loop.
 */

#ifndef CLIPSHARE_SERVER_H
#define CLIPSHARE_SERVER_H

#include "broadcast.h"
#include "error.h"
#include "platform.h"
#include "protocol.h"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace clipshare {

/// Address the server binds to by default
constexpr const char *DEFAULT_BIND_ADDRESS = "0.0.0.0";

/**
 * @brief Get the address of the interface used for outbound traffic
 *
 * Connects a UDP socket to a public address (no packet is sent).
 * @return Dotted address, or "127.0.0.1" when there is no route
 */
CLIPSHARE_API std::string get_local_ip();

/**
 * @brief Web server exposing the clipboard to the local network
 *
 * @code
 *   WebServer server(hub, "/opt/clipshare/frontend");
 *   auto result = server.start(8765);
 *   if (result) {
 *       std::cout << server.status().url << std::endl;
 *   }
 * @endcode
 */
class CLIPSHARE_API WebServer {
public:
  /// Worker threads serving clipboard requests
  static constexpr size_t WORKER_THREADS = 4;

  /**
   * @param hub Clipboard handlers and live client registry
   * @param frontend_dir Directory holding index.html and i18n.js
   */
  WebServer(BroadcastHub &hub, std::filesystem::path frontend_dir);
  ~WebServer();

  // Non-copyable
  WebServer(const WebServer &) = delete;
  WebServer &operator=(const WebServer &) = delete;

  /**
   * @brief Bind and start serving
   * @param port TCP port; 0 picks an ephemeral port
   * @param address Local address to bind
   * @return Success (also when already running) or BindFailed
   */
  Result<void> start(uint16_t port, const std::string &address =
                                        DEFAULT_BIND_ADDRESS);

  /**
   * @brief Stop serving
   *
   * Closes the listener and every live client, then waits for in-flight
   * handlers. The server can be started again afterwards.
   */
  void stop();

  /// Check if the server is running
  bool is_running() const;

  /// Bound port, 0 when stopped
  uint16_t port() const;

  /// Current status
  ServerStatus status() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipshare

#endif // CLIPSHARE_SERVER_H
