/**
 * @file monitor.h
 * @brief Clipboard change detection
 *
 * A background thread polls the clipboard on a fixed interval, compares
 * the content with the last value seen and, on change, pushes the new
 * snapshot to live clients and records it in history.
 */

#ifndef CLIPSHARE_MONITOR_H
#define CLIPSHARE_MONITOR_H

#include "broadcast.h"
#include "clipboard.h"
#include "error.h"
#include "platform.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace clipshare {

// ============================================================================
// Monitor State
// ============================================================================

/**
 * @brief Poll loop states
 *
 * Idle -> Polling -> (Unchanged | Changed) -> Idle, until Stopped.
 */
enum class MonitorState : uint8_t {
  Idle,
  Polling,
  Unchanged,
  Changed,
  Stopped
};

/// Get state name
CLIPSHARE_API const char *monitor_state_name(MonitorState state);

// ============================================================================
// Clipboard Monitor
// ============================================================================

/**
 * @brief Polls the clipboard and fans out changes
 *
 * @code
 *   ClipboardMonitor monitor(adapter, hub);
 *   monitor.set_interval(std::chrono::seconds(2));
 *   monitor.start();
 *   ...
 *   monitor.stop();   // returns at the next wake-up
 * @endcode
 */
class CLIPSHARE_API ClipboardMonitor {
public:
  /// Default tick interval
  static constexpr std::chrono::milliseconds DEFAULT_INTERVAL{2000};

  /// Shortest allowed tick interval
  static constexpr std::chrono::milliseconds MIN_INTERVAL{500};

  /**
   * @param adapter Clipboard polled each tick
   * @param hub Receives changes; its history settings govern recording
   */
  ClipboardMonitor(ClipboardAdapter &adapter, BroadcastHub &hub);
  ~ClipboardMonitor();

  // Non-copyable
  ClipboardMonitor(const ClipboardMonitor &) = delete;
  ClipboardMonitor &operator=(const ClipboardMonitor &) = delete;

  /**
   * @brief Start the poll thread
   * @return AlreadyInitialized if already running
   */
  Result<void> start();

  /**
   * @brief Signal the poll thread and wait for it to exit
   */
  void stop();

  /// Check if the poll thread is running
  bool is_running() const { return running_; }

  /**
   * @brief Set the tick interval (clamped to MIN_INTERVAL)
   *
   * Takes effect from the next wait.
   */
  void set_interval(std::chrono::milliseconds interval);

  /// Current (clamped) tick interval
  std::chrono::milliseconds interval() const;

  /**
   * @brief Run a single tick
   * @return true if the clipboard changed
   *
   * Read failures count as "unchanged".
   */
  bool poll_once();

  /// Current loop state
  MonitorState state() const;

  /// Number of completed ticks
  uint64_t tick_count() const { return tick_count_; }

  /// Last content seen, none before the first successful read
  std::optional<std::string> last_seen() const;

private:
  void run();
  void set_state(MonitorState state);

  ClipboardAdapter &adapter_;
  BroadcastHub &hub_;

  std::atomic<bool> running_{false};
  std::atomic<int64_t> interval_ms_{DEFAULT_INTERVAL.count()};
  std::atomic<uint64_t> tick_count_{0};
  std::atomic<MonitorState> state_{MonitorState::Idle};

  mutable std::mutex mutex_;
  std::optional<std::string> last_seen_;

  std::mutex wait_mutex_;
  std::condition_variable wake_;
  bool stop_requested_ = false;
  std::thread thread_;
};

} // namespace clipshare

#endif // CLIPSHARE_MONITOR_H
