/**
 * @file clipshare.h
 * @brief Main clipshare API Header
 *
 * clipshare - share the host clipboard with browsers on the local network
 *
 * This is the main header file for the clipshare library. It provides
 * a unified API for:
 * - Host clipboard access through the xclip helper
 * - Change detection and push to live clients
 * - Clipboard history
 * - The HTTP/WebSocket front end
 * - Persisted settings
 *
 * Quick Start:
 * @code
 *   #include <clipshare/clipshare.h>
 *
 *   clipshare::ClipShare service;
 *   service.init(options);
 *   service.start();
 *
 *   std::cout << service.get_server_status().url << std::endl;
 * @endcode
 */

#ifndef CLIPSHARE_CLIPSHARE_H
#define CLIPSHARE_CLIPSHARE_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"

// Feature modules (in dependency order)
#include "broadcast.h"
#include "clipboard.h"
#include "config.h"
#include "history.h"
#include "monitor.h"
#include "protocol.h"
#include "server.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clipshare {

// ============================================================================
// Version Information
// ============================================================================

/// clipshare major version
constexpr int VERSION_MAJOR = 1;

/// clipshare minor version
constexpr int VERSION_MINOR = 0;

/// clipshare patch version
constexpr int VERSION_PATCH = 0;

/// clipshare version string
constexpr const char *VERSION_STRING = "1.0.0";

/**
 * @brief Get version information
 */
struct VersionInfo {
  int major = VERSION_MAJOR;
  int minor = VERSION_MINOR;
  int patch = VERSION_PATCH;
  const char *version_string = VERSION_STRING;
  const char *build_date = __DATE__;
};

CLIPSHARE_API VersionInfo get_version();

// ============================================================================
// Service State
// ============================================================================

/**
 * @brief Overall state of the ClipShare instance
 */
enum class ServiceState : uint8_t {
  /// Not initialized
  Uninitialized = 0,

  /// Initialized, monitor and server stopped
  Idle = 1,

  /// Monitor running (server per settings)
  Running = 2
};

/**
 * @brief Get human-readable name for state
 */
CLIPSHARE_API const char *service_state_name(ServiceState state);

/**
 * @brief Startup options that are not persisted settings
 */
struct ServiceOptions {
  /// Settings file (default location if empty)
  std::filesystem::path settings_path;

  /// Directory holding the web frontend
  std::filesystem::path frontend_dir;

  /// Helper resolution inputs
  ClipboardEnvironmentOptions clipboard;

  /// Local address the server binds to
  std::string bind_address = DEFAULT_BIND_ADDRESS;

  /// Port used instead of the saved one until the next restart_server()
  std::optional<uint16_t> port_override;
};

// ============================================================================
// Main ClipShare Class
// ============================================================================

/**
 * @brief Main clipshare service
 *
 * Owns the settings, the clipboard adapter, the history, the broadcast
 * hub, the monitor and the web server.
 *
 * Typical usage flow:
 * 1. Create ClipShare instance
 * 2. Configure with init()
 * 3. start() (server per auto_start, then the monitor)
 * 4. stop() / shutdown() on exit
 */
class CLIPSHARE_API ClipShare {
public:
  ClipShare();

  /// Use @p adapter instead of the xclip adapter
  explicit ClipShare(std::unique_ptr<ClipboardAdapter> adapter);

  ~ClipShare();

  // Non-copyable
  ClipShare(const ClipShare &) = delete;
  ClipShare &operator=(const ClipShare &) = delete;

  // ========================================================================
  // Lifecycle
  // ========================================================================

  /**
   * @brief Load settings and build the subsystems
   * @return AlreadyInitialized on double init
   */
  Result<void> init(const ServiceOptions &options = {});

  /**
   * @brief Stop everything and release the subsystems
   */
  void shutdown();

  bool is_initialized() const;
  ServiceState get_state() const;

  /**
   * @brief Start the server (if auto_start) and the monitor
   * @return Server start failure; the monitor runs regardless
   */
  Result<void> start();

  /**
   * @brief Stop the monitor and the server
   */
  void stop();

  // ========================================================================
  // Server
  // ========================================================================

  /**
   * @brief Start the web server on the current port
   * @return Server URL (also when already running)
   */
  Result<std::string> start_server();

  void stop_server();

  /**
   * @brief Re-read settings from disk and rebind on the saved port
   * @return Server URL
   */
  Result<std::string> restart_server();

  /**
   * @brief Get server status
   *
   * The port is the bound port while running, else the one start_server()
   * would use.
   */
  ServerStatus get_server_status() const;

  // ========================================================================
  // Clipboard
  // ========================================================================

  /**
   * @brief Read the clipboard (recorded in history when enabled)
   */
  ClipboardSnapshot get_clipboard();

  Result<void> set_clipboard(const std::string &content,
                             const std::string &mime_type = MIME_TEXT_PLAIN,
                             bool is_base64 = false);

  /// Set the clipboard to empty text
  Result<void> clear_clipboard();

  // ========================================================================
  // Settings
  // ========================================================================

  /**
   * @brief Re-read settings from disk
   */
  ClipshareConfig get_settings();

  /**
   * @brief Validate, persist and apply settings
   *
   * History and monitor settings apply immediately; a new port is used
   * by the next start_server() or restart_server().
   */
  Result<void> save_settings(const ClipshareConfig &config);

  // ========================================================================
  // History
  // ========================================================================

  /// At most max_history entries, newest first
  std::vector<HistoryEntry> get_history() const;

  void clear_history();

  /**
   * @brief Write a history entry back to the clipboard
   */
  Result<void> restore_history_item(const HistoryEntry &entry);

  // ========================================================================
  // Subsystems
  // ========================================================================

  ConfigManager &get_config_manager();

  /// Valid between init() and shutdown()
  ClipboardMonitor &get_monitor();

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipshare

#endif // CLIPSHARE_CLIPSHARE_H
