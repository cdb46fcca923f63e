/**
 * @file protocol.cpp
 * @brief JSON encoding of clipshare messages
 */

#include "clipshare/protocol.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace clipshare {

namespace {

// Clipboard text is sanitized on read, but POSTed values are not
std::string dump(const json &j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

json clipboard_json(const ClipboardSnapshot &snapshot) {
  return json{{"success", true},
              {"type", snapshot.mime_type},
              {"content", snapshot.content},
              {"is_binary", snapshot.is_binary}};
}

json history_json(const HistoryEntry &entry) {
  return json{{"content", entry.content},
              {"timestamp", entry.timestamp},
              {"preview", entry.preview},
              {"type", entry.mime_type},
              {"is_binary", entry.is_binary}};
}

} // namespace

// ============================================================================
// Requests
// ============================================================================

Result<WriteRequest> parse_write_request(const std::string &body) {
  json j = json::parse(body, nullptr, false);
  if (j.is_discarded()) {
    return Error(ErrorCode::InvalidRequest, "Invalid JSON body");
  }
  if (!j.is_object()) {
    return Error(ErrorCode::InvalidRequest, "Request body must be an object");
  }

  WriteRequest request;
  try {
    request.content = j.value("content", std::string());
    request.mime_type = j.value("type", std::string(MIME_TEXT_PLAIN));
    request.is_base64 = j.value("is_base64", false);
  } catch (const json::exception &ex) {
    return Error(ErrorCode::InvalidRequest, "Invalid request field", ex.what());
  }

  return request;
}

// ============================================================================
// Responses
// ============================================================================

std::string serialize_clipboard(const ClipboardSnapshot &snapshot) {
  return dump(clipboard_json(snapshot));
}

std::string serialize_success(bool success) {
  return dump(json{{"success", success}});
}

std::string serialize_failure(const std::string &error) {
  return dump(json{{"success", false}, {"error", error}});
}

std::string serialize_status(const ServerStatus &status) {
  return dump(json{{"running", status.running},
                   {"ip", status.ip},
                   {"clipboard_available", status.clipboard_available}});
}

std::string serialize_history_entry(const HistoryEntry &entry) {
  return dump(history_json(entry));
}

Result<HistoryEntry> parse_history_entry(const std::string &json_text) {
  json j = json::parse(json_text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return Error(ErrorCode::InvalidRequest, "Invalid history entry");
  }
  if (!j.contains("content")) {
    return Error(ErrorCode::InvalidRequest, "History entry has no content");
  }

  HistoryEntry entry;
  try {
    entry.content = j.at("content").get<std::string>();
    entry.mime_type = j.value("type", std::string(MIME_TEXT_PLAIN));
    entry.is_binary = j.value("is_binary", false);
    entry.timestamp = j.value("timestamp", int64_t{0});
    entry.preview = j.value("preview", std::string());
  } catch (const json::exception &ex) {
    return Error(ErrorCode::InvalidRequest, "Invalid history entry field",
                 ex.what());
  }

  if (entry.preview.empty()) {
    entry.preview = make_preview(entry.content, entry.mime_type,
                                 entry.is_binary);
  }
  return entry;
}

std::string make_server_url(const std::string &ip, uint16_t port) {
  return "http://" + ip + ":" + std::to_string(port);
}

} // namespace clipshare
