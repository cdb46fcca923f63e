/**
 * @file history.cpp
 * @brief Clipboard history implementation
 */

#include "clipshare/history.h"

#include <algorithm>
#include <chrono>

namespace clipshare {

namespace {

bool is_continuation_byte(unsigned char c) { return (c & 0xC0) == 0x80; }

int64_t unix_now() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

std::string make_preview(const std::string &content,
                         const std::string &mime_type, bool is_binary) {
  if (is_binary && is_image_mime(mime_type)) {
    return content;
  }

  std::string preview;
  preview.reserve(std::min(content.size(), PREVIEW_LENGTH * 4));

  size_t code_points = 0;
  for (char c : content) {
    if (c == '\r') {
      continue;
    }
    if (!is_continuation_byte(static_cast<unsigned char>(c))) {
      if (code_points == PREVIEW_LENGTH) {
        break;
      }
      ++code_points;
    }
    preview.push_back(c == '\n' ? ' ' : c);
  }

  return preview;
}

HistoryStore::HistoryStore(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool HistoryStore::add(const std::string &content, const std::string &mime_type,
                       bool is_binary) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (content.empty() || content == last_added_) {
    return false;
  }
  last_added_ = content;

  HistoryEntry entry;
  entry.content = content;
  entry.mime_type = mime_type.empty() ? MIME_TEXT_PLAIN : mime_type;
  entry.is_binary = is_binary;
  entry.timestamp = unix_now();
  entry.preview = make_preview(content, entry.mime_type, is_binary);

  auto existing = std::find_if(
      entries_.begin(), entries_.end(),
      [&](const HistoryEntry &e) { return e.content == content; });
  if (existing != entries_.end()) {
    entries_.erase(existing);
  }

  entries_.push_front(std::move(entry));
  while (entries_.size() > capacity_) {
    entries_.pop_back();
  }

  return true;
}

std::vector<HistoryEntry> HistoryStore::list(size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = std::min(limit, entries_.size());
  return std::vector<HistoryEntry>(entries_.begin(), entries_.begin() + count);
}

Result<HistoryEntry> HistoryStore::get(size_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= entries_.size()) {
    return Error(ErrorCode::InvalidArgument, "Invalid history index");
  }
  return entries_[index];
}

void HistoryStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  last_added_.clear();
}

size_t HistoryStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace clipshare
