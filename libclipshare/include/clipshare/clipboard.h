/**
 * @file clipboard.h
 * @brief Host clipboard access through an external helper process
 *
 * The host clipboard belongs to a graphical session that may run under a
 * different user than the service. All reads and writes are therefore
 * delegated to a command-line helper (xclip) launched with an explicit
 * display/authority context, optionally through privilege elevation.
 *
 * Key properties:
 * - Lazy, one-time resolution of the helper and session context
 * - Cheap TARGETS probe before any expensive read
 * - Images are preferred when the clipboard advertises both
 * - Large writes go through a world-readable temporary file
 * - Every helper call is bounded by a timeout
 */

#ifndef CLIPSHARE_CLIPBOARD_H
#define CLIPSHARE_CLIPBOARD_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace clipshare {

// ============================================================================
// Clipboard Adapter Interface
// ============================================================================

/**
 * @brief Read/write access to the host clipboard
 *
 * Implementations report failures through try_read() and write(). The
 * non-virtual read() absorbs every failure into an empty snapshot, which is
 * what request handlers hand to clients.
 */
class CLIPSHARE_API ClipboardAdapter {
public:
  virtual ~ClipboardAdapter() = default;

  /**
   * @brief Check whether a usable helper was found
   */
  virtual bool is_available() = 0;

  /**
   * @brief Read the current clipboard content
   * @return Snapshot (possibly empty) or the failure that left no content
   */
  virtual Result<ClipboardSnapshot> try_read() = 0;

  /**
   * @brief Replace the clipboard content
   * @param content Text, or base64 when is_encoded
   * @param mime_type MIME type to advertise
   * @param is_encoded Whether content is base64-encoded binary data
   * @return Success or error
   */
  virtual Result<void> write(const std::string &content,
                             const std::string &mime_type,
                             bool is_encoded) = 0;

  /**
   * @brief Read the current clipboard content, never failing
   * @return Snapshot, or an empty text snapshot on any failure
   */
  ClipboardSnapshot read();
};

// ============================================================================
// Helper Environment
// ============================================================================

/// Default per-call limits for helper invocations
struct ClipboardTimeouts {
  /// TARGETS probe
  std::chrono::milliseconds targets{std::chrono::seconds(10)};

  /// Text read or write
  std::chrono::milliseconds text{std::chrono::seconds(15)};

  /// Image read or write
  std::chrono::milliseconds image{std::chrono::seconds(45)};
};

/**
 * @brief Inputs for resolving the helper environment
 */
struct ClipboardEnvironmentOptions {
  /// Helper shipped next to the service (preferred when present)
  std::filesystem::path bundled_helper;

  /// System helper candidates in preference order; bare names use PATH
  std::vector<std::string> system_helpers = {"/usr/bin/xclip",
                                             "/usr/local/bin/xclip", "xclip"};

  /// Runtime descriptor of the graphical session (KEY=VALUE lines)
  std::filesystem::path session_env_file =
      "/run/user/1000/gamescope-environment";

  /// Display used when the descriptor is missing or has no DISPLAY
  std::string default_display = ":0";

  /// Conventional X authority file of the session user
  std::filesystem::path authority_file = "/home/deck/.Xauthority";

  /// User owning the session; empty runs the helper directly
  std::string run_as_user = "deck";

  /// X selection operated on
  std::string selection = "clipboard";

  /// Per-call limits
  ClipboardTimeouts timeouts;
};

/**
 * @brief Immutable result of helper resolution
 */
struct ClipboardEnvironment {
  /// Resolved helper path; empty when no helper was found
  std::string helper_path;

  /// Display identifier passed as DISPLAY
  std::string display = ":0";

  /// Authority file passed as XAUTHORITY; empty when none exists
  std::string authority_file;

  /// User the helper runs as; empty runs it directly
  std::string run_as_user;

  /// X selection operated on
  std::string selection = "clipboard";

  /// Per-call limits
  ClipboardTimeouts timeouts;

  /// Check if a helper was found
  bool is_available() const { return !helper_path.empty(); }
};

/**
 * @brief A fully prepared command line
 */
struct Invocation {
  std::string program;
  std::vector<std::string> args;

  /// Render for logs
  std::string to_string() const;
};

/**
 * @brief Resolve the helper binary and session context
 *
 * Reads DISPLAY from the session descriptor, picks the bundled helper
 * (making it executable if needed) or the first usable system helper, and
 * records the authority file when it exists.
 */
CLIPSHARE_API ClipboardEnvironment
resolve_environment(const ClipboardEnvironmentOptions &options);

/**
 * @brief Read the DISPLAY value from a session descriptor file
 * @return Display identifier, or error if the file is missing or has none
 */
CLIPSHARE_API Result<std::string>
read_session_display(const std::filesystem::path &env_file);

/**
 * @brief Wrap helper arguments with the cached display/authority context
 *
 * Produces `sudo -u <user> env DISPLAY=.. [XAUTHORITY=..] <helper> <args>`,
 * or `env DISPLAY=.. [XAUTHORITY=..] <helper> <args>` without a run-as
 * user. The context is passed explicitly because privilege elevation does
 * not preserve the caller's environment.
 */
CLIPSHARE_API Invocation
build_invocation(const ClipboardEnvironment &env,
                 const std::vector<std::string> &helper_args);

// ============================================================================
// Target Negotiation
// ============================================================================

/// Text targets in priority order
CLIPSHARE_API const std::vector<std::string> &text_targets();

/// Split helper TARGETS output into target names
CLIPSHARE_API std::vector<std::string>
parse_targets(const std::string &targets_output);

/// Select the best text target, empty if none is advertised
CLIPSHARE_API std::string
select_text_target(const std::vector<std::string> &targets);

/// Check whether an image target is advertised
CLIPSHARE_API bool has_image_target(const std::vector<std::string> &targets);

/**
 * @brief Resolve a file:// reference to an image snapshot
 * @param uri Clipboard text starting with file://
 * @return Image snapshot when the URI names an existing image file
 *
 * The MIME type derives from the extension (jpg/jpeg -> image/jpeg,
 * others -> image/<ext>).
 */
CLIPSHARE_API Result<ClipboardSnapshot>
read_image_from_uri(const std::string &uri);

// ============================================================================
// xclip Adapter
// ============================================================================

/**
 * @brief ClipboardAdapter backed by the xclip helper
 *
 * Example usage:
 * @code
 *   ClipboardEnvironmentOptions options;
 *   options.bundled_helper = plugin_dir / "bin" / "xclip";
 *
 *   XclipClipboard clipboard(options);
 *   if (clipboard.write("hello", "text/plain", false)) {
 *       auto snapshot = clipboard.read();
 *   }
 * @endcode
 *
 * Concurrent reads may overlap; writes are serialized.
 */
class CLIPSHARE_API XclipClipboard : public ClipboardAdapter {
public:
  /// Resolve the environment lazily on first use
  explicit XclipClipboard(ClipboardEnvironmentOptions options = {});

  /// Use an already resolved environment
  explicit XclipClipboard(ClipboardEnvironment environment);

  ~XclipClipboard() override;

  // Non-copyable
  XclipClipboard(const XclipClipboard &) = delete;
  XclipClipboard &operator=(const XclipClipboard &) = delete;

  bool is_available() override;
  Result<ClipboardSnapshot> try_read() override;
  Result<void> write(const std::string &content, const std::string &mime_type,
                     bool is_encoded) override;

  /**
   * @brief Get the resolved environment (resolving it if needed)
   */
  const ClipboardEnvironment &environment();

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipshare

#endif // CLIPSHARE_CLIPBOARD_H
