/**
 * @file types.h
 * @brief Core type definitions for clipshare
 */

#ifndef CLIPSHARE_TYPES_H
#define CLIPSHARE_TYPES_H

#include "platform.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace clipshare {

// ============================================================================
// Basic Types
// ============================================================================

using Byte = uint8_t;
using Bytes = std::vector<Byte>;

// ============================================================================
// MIME Types
// ============================================================================

/// Marker for text snapshots
constexpr const char *MIME_TEXT_PLAIN = "text/plain";

/// The single image encoding read from the clipboard
constexpr const char *MIME_IMAGE_PNG = "image/png";

/// Check whether a MIME type names an image encoding
CLIPSHARE_API bool is_image_mime(const std::string &mime_type);

// ============================================================================
// Clipboard Snapshot
// ============================================================================

/**
 * @brief The clipboard's current content plus its type metadata
 *
 * Binary payloads are kept base64-encoded in @c content so that a snapshot
 * can cross any text-only boundary (JSON, WebSocket text frames, history)
 * without further conversion. An empty non-binary snapshot means
 * "empty or unavailable" and is not an error by itself.
 */
struct ClipboardSnapshot {
  /// UTF-8 text, or base64 when is_binary
  std::string content;

  /// MIME type ("text/plain", "image/png", ...)
  std::string mime_type = MIME_TEXT_PLAIN;

  /// Whether content carries encoded binary data
  bool is_binary = false;

  /// Check if the snapshot carries no content
  bool is_empty() const { return content.empty(); }

  bool operator==(const ClipboardSnapshot &other) const {
    return content == other.content && mime_type == other.mime_type &&
           is_binary == other.is_binary;
  }
  bool operator!=(const ClipboardSnapshot &other) const {
    return !(*this == other);
  }

  /// Empty, non-binary snapshot
  static ClipboardSnapshot empty();

  /// Create from UTF-8 text
  static ClipboardSnapshot from_text(std::string text);

  /// Create from raw image bytes (encodes them)
  static ClipboardSnapshot from_image(const Bytes &data,
                                      std::string mime_type = MIME_IMAGE_PNG);
};

} // namespace clipshare

#endif // CLIPSHARE_TYPES_H
