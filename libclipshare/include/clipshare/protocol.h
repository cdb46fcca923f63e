/**
 * @file protocol.h
 * @brief clipshare wire protocol definitions
 *
 * HTTP and WebSocket payloads are JSON objects. Binary clipboard content
 * is carried as standard base64 text with `is_binary` set.
 */

#ifndef CLIPSHARE_PROTOCOL_H
#define CLIPSHARE_PROTOCOL_H

#include "clipshare/error.h"
#include "clipshare/history.h"
#include "clipshare/types.h"
#include <cstddef>
#include <cstdint>
#include <string>

namespace clipshare {

// ============================================================================
// Protocol Constants
// ============================================================================

/// Keep-alive token sent by clients
constexpr const char *PING_MESSAGE = "ping";

/// Keep-alive acknowledgment
constexpr const char *PONG_MESSAGE = "pong";

/// Maximum accepted request body (50 MB, enough for image uploads)
constexpr size_t MAX_REQUEST_BODY_SIZE = 50 * 1024 * 1024;

// ============================================================================
// Requests
// ============================================================================

/**
 * @brief Body of `POST /api/clipboard`
 */
struct WriteRequest {
  std::string content;
  std::string mime_type = MIME_TEXT_PLAIN;
  bool is_base64 = false;
};

/**
 * @brief Parse a `POST /api/clipboard` body
 *
 * Missing keys keep their defaults.
 * @return Request, or InvalidRequest when the body is not a JSON object
 *         or a key has the wrong type
 */
CLIPSHARE_API Result<WriteRequest> parse_write_request(const std::string &body);

// ============================================================================
// Responses
// ============================================================================

/**
 * @brief Status reported by `GET /api/status`
 */
struct ServerStatus {
  bool running = false;
  std::string ip;
  uint16_t port = 0;
  std::string url;
  bool clipboard_available = false;
};

/// `{success:true, type, content, is_binary}`
CLIPSHARE_API std::string serialize_clipboard(const ClipboardSnapshot &snapshot);

/// `{success}`
CLIPSHARE_API std::string serialize_success(bool success);

/// `{success:false, error}`
CLIPSHARE_API std::string serialize_failure(const std::string &error);

/// `{running, ip, clipboard_available}`
CLIPSHARE_API std::string serialize_status(const ServerStatus &status);

/// `{content, timestamp, preview, type, is_binary}`
CLIPSHARE_API std::string serialize_history_entry(const HistoryEntry &entry);

/**
 * @brief Parse a history entry as produced by serialize_history_entry()
 *
 * Only `content` is required; `preview` is rebuilt when missing.
 */
CLIPSHARE_API Result<HistoryEntry>
parse_history_entry(const std::string &json_text);

/**
 * @brief Build the URL clients use to reach the server
 */
CLIPSHARE_API std::string make_server_url(const std::string &ip,
                                          uint16_t port);

} // namespace clipshare

#endif // CLIPSHARE_PROTOCOL_H
