/**
 * @file clipboard.cpp
 * @brief Clipboard adapter implementation
 */

#include "clipboard_pimpl.h"
#include "clipshare/encoding.h"
#include "clipshare/logging.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace clipshare {

namespace {

const std::set<std::string> &image_extensions() {
  static const std::set<std::string> extensions = {
      ".png", ".jpg", ".jpeg", ".gif", ".bmp", ".webp"};
  return extensions;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

/// Extract the local path from a file:// URI
std::string uri_to_path(const std::string &uri) {
  // Only the first entry of a text/uri-list is considered
  std::string first = uri.substr(0, uri.find_first_of("\r\n"));
  while (!first.empty() &&
         std::isspace(static_cast<unsigned char>(first.back()))) {
    first.pop_back();
  }

  constexpr const char *SCHEME = "file://";
  std::string rest = first.substr(std::string(SCHEME).size());

  // Skip the authority (usually empty or "localhost")
  auto slash = rest.find('/');
  if (slash == std::string::npos) {
    return "";
  }
  std::string path = rest.substr(slash);

  auto cut = path.find_first_of("?#");
  if (cut != std::string::npos) {
    path.resize(cut);
  }

  return percent_decode(path);
}

} // namespace

// ============================================================================
// ClipboardAdapter
// ============================================================================

ClipboardSnapshot ClipboardAdapter::read() {
  auto result = try_read();
  if (result.is_error()) {
    CLIPSHARE_LOG_ERROR("Clipboard read error: {}",
                        result.error().to_string());
    return ClipboardSnapshot::empty();
  }
  return std::move(result).value();
}

// ============================================================================
// Invocation
// ============================================================================

std::string Invocation::to_string() const {
  std::ostringstream oss;
  oss << program;
  for (const auto &arg : args) {
    oss << ' ' << arg;
  }
  return oss.str();
}

Invocation build_invocation(const ClipboardEnvironment &env,
                            const std::vector<std::string> &helper_args) {
  Invocation inv;

  if (!env.run_as_user.empty()) {
    inv.program = "sudo";
    inv.args = {"-u", env.run_as_user, "env"};
  } else {
    inv.program = "env";
  }

  inv.args.push_back("DISPLAY=" + env.display);
  if (!env.authority_file.empty()) {
    inv.args.push_back("XAUTHORITY=" + env.authority_file);
  }

  inv.args.push_back(env.helper_path);
  inv.args.insert(inv.args.end(), helper_args.begin(), helper_args.end());
  return inv;
}

// ============================================================================
// Environment Resolution
// ============================================================================

Result<std::string> read_session_display(const fs::path &env_file) {
  std::error_code ec;
  if (!fs::exists(env_file, ec)) {
    return Error(ErrorCode::FileNotFound, "Session descriptor not found",
                 env_file.string());
  }

  std::ifstream file(env_file);
  if (!file) {
    return Error(ErrorCode::FileReadError, "Cannot open session descriptor",
                 env_file.string());
  }

  std::string line;
  while (std::getline(file, line)) {
    if (line.rfind("DISPLAY=", 0) != 0) {
      continue;
    }
    std::string value = line.substr(8);
    while (!value.empty() &&
           std::isspace(static_cast<unsigned char>(value.back()))) {
      value.pop_back();
    }
    return value;
  }

  return Error(ErrorCode::InvalidState, "No DISPLAY in session descriptor",
               env_file.string());
}

ClipboardEnvironment
resolve_environment(const ClipboardEnvironmentOptions &options) {
  return platform_resolve_environment(options);
}

// ============================================================================
// Target Negotiation
// ============================================================================

const std::vector<std::string> &text_targets() {
  static const std::vector<std::string> targets = {
      "UTF8_STRING", "text/plain", "text/uri-list", "STRING"};
  return targets;
}

std::vector<std::string> parse_targets(const std::string &targets_output) {
  std::istringstream iss(targets_output);
  return std::vector<std::string>(std::istream_iterator<std::string>(iss),
                                  std::istream_iterator<std::string>());
}

std::string select_text_target(const std::vector<std::string> &targets) {
  for (const auto &candidate : text_targets()) {
    if (std::find(targets.begin(), targets.end(), candidate) !=
        targets.end()) {
      return candidate;
    }
  }
  return "";
}

bool has_image_target(const std::vector<std::string> &targets) {
  return std::any_of(targets.begin(), targets.end(), [](const std::string &t) {
    return t == "image/png" || t == "image/jpeg";
  });
}

Result<ClipboardSnapshot> read_image_from_uri(const std::string &uri) {
  if (uri.rfind("file://", 0) != 0) {
    return Error(ErrorCode::InvalidArgument, "Not a file URI");
  }

  fs::path file_path = uri_to_path(uri);
  if (file_path.empty()) {
    return Error(ErrorCode::InvalidArgument, "Malformed file URI");
  }

  std::string ext = to_lower(file_path.extension().string());
  if (image_extensions().count(ext) == 0) {
    return Error(ErrorCode::NotSupported, "Not an image file",
                 file_path.string());
  }

  std::error_code ec;
  if (!fs::is_regular_file(file_path, ec)) {
    CLIPSHARE_LOG_ERROR("Image file not found: {}", file_path.string());
    return Error(ErrorCode::FileNotFound, "Image file not found",
                 file_path.string());
  }

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    return Error(ErrorCode::FileReadError, "Cannot open image file",
                 file_path.string());
  }
  Bytes data((std::istreambuf_iterator<char>(file)),
             std::istreambuf_iterator<char>());
  if (file.bad()) {
    return Error(ErrorCode::FileReadError, "Failed to read image file",
                 file_path.string());
  }

  std::string mime_type = (ext == ".jpg" || ext == ".jpeg")
                              ? std::string("image/jpeg")
                              : "image/" + ext.substr(1);
  CLIPSHARE_LOG_INFO("Read image from URI: {} bytes, {}", data.size(),
                     mime_type);

  return ClipboardSnapshot::from_image(data, mime_type);
}

// ============================================================================
// XclipClipboard
// ============================================================================

XclipClipboard::XclipClipboard(ClipboardEnvironmentOptions options)
    : impl_(std::make_unique<Impl>()) {
  impl_->options = std::move(options);
}

XclipClipboard::XclipClipboard(ClipboardEnvironment environment)
    : impl_(std::make_unique<Impl>()) {
  impl_->environment = std::move(environment);
  // Already resolved, consume the once flag
  std::call_once(impl_->resolve_once, [] {});
}

XclipClipboard::~XclipClipboard() = default;

const ClipboardEnvironment &XclipClipboard::environment() {
  std::call_once(impl_->resolve_once, [this] {
    impl_->environment = platform_resolve_environment(impl_->options);
  });
  return impl_->environment;
}

bool XclipClipboard::is_available() { return environment().is_available(); }

Result<ClipboardSnapshot> XclipClipboard::try_read() {
  const auto &env = environment();
  if (!env.is_available()) {
    return Error(ErrorCode::UtilityUnavailable, "xclip not available");
  }
  return platform_read_clipboard(env);
}

Result<void> XclipClipboard::write(const std::string &content,
                                   const std::string &mime_type,
                                   bool is_encoded) {
  const auto &env = environment();
  if (!env.is_available()) {
    CLIPSHARE_LOG_ERROR("xclip not available");
    return Error(ErrorCode::UtilityUnavailable, "xclip not available");
  }

  Bytes data;
  if (is_encoded) {
    auto decoded = base64_decode(content);
    if (decoded.is_error()) {
      CLIPSHARE_LOG_ERROR("Data encoding error: {}",
                          decoded.error().to_string());
      return decoded.error();
    }
    data = std::move(decoded).value();
  } else {
    data.assign(content.begin(), content.end());
  }

  std::string type = mime_type.empty() ? MIME_TEXT_PLAIN : mime_type;

  std::lock_guard<std::mutex> lock(impl_->write_mutex);
  return platform_write_clipboard(env, data, type);
}

} // namespace clipshare
