/**
 * @file monitor.cpp
 * @brief Clipboard monitor implementation
 */

#include "clipshare/monitor.h"
#include "clipshare/logging.h"

#include <algorithm>

namespace clipshare {

const char *monitor_state_name(MonitorState state) {
  switch (state) {
  case MonitorState::Idle:
    return "Idle";
  case MonitorState::Polling:
    return "Polling";
  case MonitorState::Unchanged:
    return "Unchanged";
  case MonitorState::Changed:
    return "Changed";
  case MonitorState::Stopped:
    return "Stopped";
  default:
    return "Unknown";
  }
}

ClipboardMonitor::ClipboardMonitor(ClipboardAdapter &adapter,
                                   BroadcastHub &hub)
    : adapter_(adapter), hub_(hub) {}

ClipboardMonitor::~ClipboardMonitor() { stop(); }

// ============================================================================
// Lifecycle
// ============================================================================

Result<void> ClipboardMonitor::start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return Error(ErrorCode::AlreadyInitialized, "Monitor already running");
  }

  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    stop_requested_ = false;
  }
  set_state(MonitorState::Idle);

  thread_ = std::thread(&ClipboardMonitor::run, this);
  CLIPSHARE_LOG_INFO("Clipboard monitor started");
  return Result<void>::ok();
}

void ClipboardMonitor::stop() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    stop_requested_ = true;
  }
  wake_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
    CLIPSHARE_LOG_INFO("Clipboard monitor stopped");
  }

  running_ = false;
  set_state(MonitorState::Stopped);
}

void ClipboardMonitor::run() {
  for (;;) {
    poll_once();

    std::unique_lock<std::mutex> lock(wait_mutex_);
    if (wake_.wait_for(lock, interval(), [this] { return stop_requested_; })) {
      break;
    }
  }
}

// ============================================================================
// Polling
// ============================================================================

void ClipboardMonitor::set_interval(std::chrono::milliseconds interval) {
  interval_ms_ = std::max(interval, MIN_INTERVAL).count();
}

std::chrono::milliseconds ClipboardMonitor::interval() const {
  return std::chrono::milliseconds(interval_ms_.load());
}

bool ClipboardMonitor::poll_once() {
  set_state(MonitorState::Polling);

  std::optional<ClipboardSnapshot> changed;
  {
    std::lock_guard<std::mutex> record_lock(hub_.record_mutex());

    auto result = adapter_.try_read();
    if (result.is_error()) {
      CLIPSHARE_LOG_DEBUG("Monitor error: {}", result.error().to_string());
    } else {
      ClipboardSnapshot snapshot = std::move(result).value();

      std::lock_guard<std::mutex> lock(mutex_);
      if (!last_seen_ || *last_seen_ != snapshot.content) {
        last_seen_ = snapshot.content;
        hub_.record_locked(snapshot);
        changed = std::move(snapshot);
      }
    }
  }

  if (changed) {
    set_state(MonitorState::Changed);
    if (hub_.client_count() > 0) {
      hub_.broadcast(*changed);
    }
  } else {
    set_state(MonitorState::Unchanged);
  }

  ++tick_count_;
  set_state(MonitorState::Idle);
  return changed.has_value();
}

MonitorState ClipboardMonitor::state() const { return state_; }

std::optional<std::string> ClipboardMonitor::last_seen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_seen_;
}

void ClipboardMonitor::set_state(MonitorState state) {
  MonitorState from = state_.exchange(state);
  if (from != state) {
    CLIPSHARE_LOG_TRACE("Monitor: {} -> {}", monitor_state_name(from),
                        monitor_state_name(state));
  }
}

} // namespace clipshare
