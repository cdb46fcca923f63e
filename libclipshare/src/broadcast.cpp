/**
 * @file broadcast.cpp
 * @brief Broadcast hub implementation
 */

#include "clipshare/broadcast.h"
#include "clipshare/logging.h"
#include "clipshare/protocol.h"

#include <algorithm>

namespace clipshare {

BroadcastHub::BroadcastHub(ClipboardAdapter &adapter, HistoryStore &history)
    : adapter_(adapter), history_(history) {}

BroadcastHub::~BroadcastHub() { close_all(); }

// ============================================================================
// Live Clients
// ============================================================================

void BroadcastHub::register_client(const LiveClientPtr &client) {
  if (!client) {
    return;
  }
  std::lock_guard<std::mutex> lock(clients_mutex_);
  if (std::find(clients_.begin(), clients_.end(), client) == clients_.end()) {
    clients_.push_back(client);
  }
}

void BroadcastHub::unregister_client(const LiveClient *client) {
  std::lock_guard<std::mutex> lock(clients_mutex_);
  clients_.erase(std::remove_if(clients_.begin(), clients_.end(),
                                [client](const LiveClientPtr &c) {
                                  return c.get() == client;
                                }),
                 clients_.end());
}

size_t BroadcastHub::client_count() const {
  std::lock_guard<std::mutex> lock(clients_mutex_);
  return clients_.size();
}

size_t BroadcastHub::broadcast(const ClipboardSnapshot &snapshot) {
  std::lock_guard<std::mutex> order_lock(broadcast_mutex_);

  std::vector<LiveClientPtr> targets;
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    targets = clients_;
  }
  if (targets.empty()) {
    return 0;
  }

  std::string message = serialize_clipboard(snapshot);

  size_t delivered = 0;
  for (const auto &client : targets) {
    auto result = client->send_text(message);
    if (result.is_ok()) {
      ++delivered;
      continue;
    }
    CLIPSHARE_LOG_ERROR("Failed to send to websocket: {}",
                        result.error().to_string());
    unregister_client(client.get());
  }

  return delivered;
}

void BroadcastHub::close_all() {
  // Waits out a broadcast still sending to the clients being closed
  std::lock_guard<std::mutex> order_lock(broadcast_mutex_);

  std::vector<LiveClientPtr> targets;
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    targets.swap(clients_);
  }
  for (const auto &client : targets) {
    client->close();
  }
}

std::optional<std::string>
BroadcastHub::handle_message(const std::string &message) {
  if (message == PING_MESSAGE) {
    return std::string(PONG_MESSAGE);
  }
  return std::nullopt;
}

// ============================================================================
// Synchronous Handlers
// ============================================================================

ClipboardSnapshot BroadcastHub::handle_read() {
  std::lock_guard<std::mutex> lock(record_mutex_);
  ClipboardSnapshot snapshot = adapter_.read();
  record_locked(snapshot);
  return snapshot;
}

void BroadcastHub::record_locked(const ClipboardSnapshot &snapshot) {
  if (history_enabled_ && !snapshot.is_empty()) {
    history_.add(snapshot);
  }
}

Result<void> BroadcastHub::handle_write(const std::string &content,
                                        const std::string &mime_type,
                                        bool is_encoded) {
  return adapter_.write(content, mime_type, is_encoded);
}

} // namespace clipshare
