/**
 * @file broadcast.h
 * @brief Live client registry and clipboard request handling
 *
 * The hub owns the set of live (push) connections and fans clipboard
 * changes out to them. It also serves the synchronous read/write
 * requests so that every entry point shares one adapter and one history.
 */

#ifndef CLIPSHARE_BROADCAST_H
#define CLIPSHARE_BROADCAST_H

#include "clipboard.h"
#include "error.h"
#include "history.h"
#include "platform.h"
#include "types.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace clipshare {

// ============================================================================
// Live Client
// ============================================================================

/**
 * @brief An open streaming connection awaiting push notifications
 */
class CLIPSHARE_API LiveClient {
public:
  virtual ~LiveClient() = default;

  /**
   * @brief Queue a text message
   * @return NetworkSendError or ConnectionClosed when the client is gone
   */
  virtual Result<void> send_text(const std::string &message) = 0;

  /// Close the connection
  virtual void close() = 0;
};

using LiveClientPtr = std::shared_ptr<LiveClient>;

// ============================================================================
// Broadcast Hub
// ============================================================================

class CLIPSHARE_API BroadcastHub {
public:
  /**
   * @param adapter Clipboard used by the request handlers
   * @param history Store fed by handle_read() when history is enabled
   */
  BroadcastHub(ClipboardAdapter &adapter, HistoryStore &history);
  ~BroadcastHub();

  // Non-copyable
  BroadcastHub(const BroadcastHub &) = delete;
  BroadcastHub &operator=(const BroadcastHub &) = delete;

  // ========================================================================
  // Live Clients
  // ========================================================================

  void register_client(const LiveClientPtr &client);
  void unregister_client(const LiveClient *client);

  /// Number of registered clients
  size_t client_count() const;

  /**
   * @brief Push a snapshot to every registered client
   * @return Number of clients that accepted the message
   *
   * A client whose send fails is removed; delivery to the others
   * continues.
   */
  size_t broadcast(const ClipboardSnapshot &snapshot);

  /// Close and forget every registered client
  void close_all();

  /**
   * @brief Handle a text message received from a live client
   * @return Reply to send back, if any
   */
  std::optional<std::string> handle_message(const std::string &message);

  // ========================================================================
  // Synchronous Handlers
  // ========================================================================

  /**
   * @brief Read the clipboard for a request
   *
   * Never fails; records non-empty content when history is enabled.
   */
  ClipboardSnapshot handle_read();

  /**
   * @brief Write the clipboard for a request
   */
  Result<void> handle_write(const std::string &content,
                            const std::string &mime_type, bool is_encoded);

  /// Enable/disable history recording
  void set_history_enabled(bool enabled) { history_enabled_ = enabled; }
  bool history_enabled() const { return history_enabled_; }

  ClipboardAdapter &adapter() { return adapter_; }
  HistoryStore &history() { return history_; }

  // ========================================================================
  // Recording
  // ========================================================================

  /**
   * @brief Lock held across a read and its history record
   *
   * handle_read() and the monitor's compare-and-record step both take
   * it, so history order equals detection order. Broadcasting happens
   * outside it.
   */
  std::mutex &record_mutex() { return record_mutex_; }

  /**
   * @brief Add non-empty content to history when enabled
   * @pre The caller holds record_mutex()
   */
  void record_locked(const ClipboardSnapshot &snapshot);

private:
  ClipboardAdapter &adapter_;
  HistoryStore &history_;
  std::atomic<bool> history_enabled_{false};

  mutable std::mutex clients_mutex_;
  std::vector<LiveClientPtr> clients_;

  // Keeps per-client message order equal to broadcast order
  std::mutex broadcast_mutex_;

  std::mutex record_mutex_;
};

} // namespace clipshare

#endif // CLIPSHARE_BROADCAST_H
