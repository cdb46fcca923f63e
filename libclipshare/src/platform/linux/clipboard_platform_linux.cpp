/**
 * @file clipboard_platform_linux.cpp
 * @brief Clipboard platform hooks for Linux
 *
 * Implements the platform hooks declared in clipboard_pimpl.h on top of
 * the xclip primitives.
 */

#include "../../clipboard_pimpl.h"
#include "clipboard_linux.h"
#include "clipshare/encoding.h"
#include "clipshare/logging.h"

#include <filesystem>
#include <optional>

namespace clipshare {

// ============================================================================
// Platform Hook Implementations
// ============================================================================

ClipboardEnvironment
platform_resolve_environment(const ClipboardEnvironmentOptions &options) {
  ClipboardEnvironment env;
  env.run_as_user = options.run_as_user;
  env.selection = options.selection;
  env.timeouts = options.timeouts;

  auto display = read_session_display(options.session_env_file);
  if (display.is_ok() && !display.value().empty()) {
    env.display = display.value();
    CLIPSHARE_LOG_INFO("Session DISPLAY: {}", env.display);
  } else {
    env.display = options.default_display;
    CLIPSHARE_LOG_INFO("Using default DISPLAY: {}", env.display);
  }

  env.helper_path = platform::find_helper(options);
  if (env.helper_path.empty()) {
    CLIPSHARE_LOG_ERROR("xclip not found! Clipboard will not work.");
  } else {
    CLIPSHARE_LOG_INFO("Using xclip: {}", env.helper_path);
  }

  std::error_code ec;
  if (!options.authority_file.empty() &&
      std::filesystem::exists(options.authority_file, ec)) {
    env.authority_file = options.authority_file.string();
  }

  return env;
}

Result<ClipboardSnapshot>
platform_read_clipboard(const ClipboardEnvironment &env) {
  using namespace platform;

  // Cheap probe first; an empty list means "try text anyway"
  std::vector<std::string> targets;
  auto targets_result = query_targets(env);
  if (targets_result.is_ok()) {
    targets = parse_targets(targets_result.value());
    CLIPSHARE_LOG_DEBUG("Clipboard targets: {}", targets_result.value());
  }

  std::optional<Error> last_error;

  if (has_image_target(targets)) {
    auto image = read_target(env, MIME_IMAGE_PNG, env.timeouts.image);
    if (image.is_ok() && !image.value().empty()) {
      CLIPSHARE_LOG_INFO("Read image from clipboard: {} bytes",
                         image.value().size());
      return ClipboardSnapshot::from_image(image.value(), MIME_IMAGE_PNG);
    }
    if (image.is_error()) {
      last_error = image.error();
    }
  }

  std::string text_target = select_text_target(targets);
  if (!text_target.empty() || targets.empty()) {
    auto raw = read_target(env, text_target, env.timeouts.text);
    if (raw.is_error()) {
      return raw.error();
    }

    const auto &bytes = raw.value();
    std::string text = sanitize_utf8(std::string(bytes.begin(), bytes.end()));

    if (text.rfind("file://", 0) == 0) {
      auto image = read_image_from_uri(text);
      if (image.is_ok()) {
        return image;
      }
      CLIPSHARE_LOG_DEBUG("File reference is not a readable image: {}",
                          image.error().to_string());
    }

    return ClipboardSnapshot::from_text(std::move(text));
  }

  if (last_error) {
    return *last_error;
  }
  return ClipboardSnapshot::empty();
}

Result<void> platform_write_clipboard(const ClipboardEnvironment &env,
                                      const Bytes &data,
                                      const std::string &mime_type) {
  platform::TempFile file;
  auto created = file.create(data);
  if (created.is_error()) {
    CLIPSHARE_LOG_ERROR("Failed to set clipboard: {}",
                        created.error().to_string());
    return created;
  }

  auto timeout =
      is_image_mime(mime_type) ? env.timeouts.image : env.timeouts.text;
  auto result = platform::write_from_file(env, file.path(), mime_type, timeout);
  if (result.is_error()) {
    CLIPSHARE_LOG_ERROR("Failed to set clipboard: {}",
                        result.error().to_string());
    return result;
  }

  CLIPSHARE_LOG_DEBUG("Clipboard set: {} bytes as {}", data.size(), mime_type);
  return Result<void>::ok();
}

} // namespace clipshare
