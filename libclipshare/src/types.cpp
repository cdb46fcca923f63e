/**
 * @file types.cpp
 * @brief Core type helpers
 */

#include "clipshare/types.h"
#include "clipshare/encoding.h"

namespace clipshare {

bool is_image_mime(const std::string &mime_type) {
  return mime_type.rfind("image/", 0) == 0;
}

// ============================================================================
// ClipboardSnapshot
// ============================================================================

ClipboardSnapshot ClipboardSnapshot::empty() { return ClipboardSnapshot{}; }

ClipboardSnapshot ClipboardSnapshot::from_text(std::string text) {
  ClipboardSnapshot snapshot;
  snapshot.content = std::move(text);
  snapshot.mime_type = MIME_TEXT_PLAIN;
  snapshot.is_binary = false;
  return snapshot;
}

ClipboardSnapshot ClipboardSnapshot::from_image(const Bytes &data,
                                                std::string mime_type) {
  ClipboardSnapshot snapshot;
  snapshot.content = base64_encode(data);
  snapshot.mime_type = std::move(mime_type);
  snapshot.is_binary = true;
  return snapshot;
}

} // namespace clipshare
