/**
 * @file history.h
 * @brief Bounded, duplicate-free clipboard history
 *
 * Entries are kept newest first. Adding content that is already stored
 * moves it to the front instead of growing the store.
 */

#ifndef CLIPSHARE_HISTORY_H
#define CLIPSHARE_HISTORY_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace clipshare {

// ============================================================================
// History Entry
// ============================================================================

/**
 * @brief A record of a clipboard value at the time it was observed
 */
struct HistoryEntry {
  /// Text, or base64 when is_binary
  std::string content;

  /// MIME type of the content
  std::string mime_type = MIME_TEXT_PLAIN;

  /// Whether content carries encoded binary data
  bool is_binary = false;

  /// Seconds since the Unix epoch
  int64_t timestamp = 0;

  /// Display preview (see make_preview)
  std::string preview;

  /// Convert back to a snapshot
  ClipboardSnapshot to_snapshot() const {
    ClipboardSnapshot snapshot;
    snapshot.content = content;
    snapshot.mime_type = mime_type;
    snapshot.is_binary = is_binary;
    return snapshot;
  }
};

/// Maximum number of code points in a text preview
constexpr size_t PREVIEW_LENGTH = 100;

/**
 * @brief Build the preview shown for a history entry
 *
 * Binary images keep their full encoded payload. Text has line breaks
 * flattened and is cut to PREVIEW_LENGTH code points.
 */
CLIPSHARE_API std::string make_preview(const std::string &content,
                                       const std::string &mime_type,
                                       bool is_binary);

// ============================================================================
// History Store
// ============================================================================

/**
 * @brief Thread-safe clipboard history
 */
class CLIPSHARE_API HistoryStore {
public:
  /// Fixed store capacity
  static constexpr size_t DEFAULT_CAPACITY = 50;

  explicit HistoryStore(size_t capacity = DEFAULT_CAPACITY);

  // Non-copyable
  HistoryStore(const HistoryStore &) = delete;
  HistoryStore &operator=(const HistoryStore &) = delete;

  /**
   * @brief Record a clipboard value
   * @return true if the store changed
   *
   * Empty content and a repeat of the previously added content are
   * ignored. An existing entry with the same content is removed before
   * the new one is inserted at the front; the oldest entry is evicted
   * when the store is full.
   */
  bool add(const std::string &content,
           const std::string &mime_type = MIME_TEXT_PLAIN,
           bool is_binary = false);

  /// Record a snapshot
  bool add(const ClipboardSnapshot &snapshot) {
    return add(snapshot.content, snapshot.mime_type, snapshot.is_binary);
  }

  /**
   * @brief Get up to @p limit entries, newest first
   */
  std::vector<HistoryEntry> list(size_t limit) const;

  /**
   * @brief Get the entry at @p index (0 is newest)
   */
  Result<HistoryEntry> get(size_t index) const;

  /// Remove all entries
  void clear();

  /// Number of stored entries
  size_t size() const;

  /// Maximum number of stored entries
  size_t capacity() const { return capacity_; }

private:
  const size_t capacity_;

  mutable std::mutex mutex_;
  std::deque<HistoryEntry> entries_;
  std::string last_added_;
};

} // namespace clipshare

#endif // CLIPSHARE_HISTORY_H
