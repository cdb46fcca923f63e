/**
 * @file config.h
 * @brief Persisted user settings for clipshare
 */

#ifndef CLIPSHARE_CONFIG_H
#define CLIPSHARE_CONFIG_H

#include "error.h"
#include "platform.h"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace clipshare {

// ============================================================================
// User Configuration
// ============================================================================

/**
 * @brief Settings persisted in settings.json
 */
struct ClipshareConfig {
  /// Longest accepted poll interval in seconds
  static constexpr double MAX_MONITOR_INTERVAL = 3600.0;

  // ========================================================================
  // Server
  // ========================================================================

  /// Start the web server when the service starts
  bool auto_start = true;

  /// TCP port of the web server
  int port = 8765;

  /// Client refresh period in seconds (read by the frontend)
  int refresh_interval = 3;

  // ========================================================================
  // Clipboard
  // ========================================================================

  /// Seconds between clipboard polls (clamped to 0.5 at use)
  double monitor_interval = 2.0;

  /// Record clipboard values in history
  bool enable_history = false;

  /// Number of history entries returned to clients
  int max_history = 20;

  // ========================================================================
  // Methods
  // ========================================================================

  /// Reset every field to its default
  void load_defaults();

  /// Validate configuration
  Result<void> validate() const;

  /// Poll interval as a duration
  std::chrono::milliseconds monitor_period() const;

  bool operator==(const ClipshareConfig &other) const;
  bool operator!=(const ClipshareConfig &other) const {
    return !(*this == other);
  }

  /// Serialize as pretty-printed JSON
  std::string to_json() const;

  /**
   * @brief Parse settings JSON merged over the defaults
   *
   * Missing keys keep their defaults, unknown keys are ignored and values
   * of the wrong type are replaced by the default with a warning.
   * @return Config, or ConfigParseError if the text is not a JSON object
   */
  static Result<ClipshareConfig> from_json(const std::string &text);

  /// Get default config directory for platform
  static std::filesystem::path get_default_config_dir();

  /// Get default settings file path
  static std::filesystem::path get_default_settings_path();
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * @brief Manages loading, saving, and validating configuration
 */
class CLIPSHARE_API ConfigManager {
public:
  ConfigManager();
  ~ConfigManager();

  // Non-copyable
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  // ========================================================================
  // Initialization
  // ========================================================================

  /**
   * @brief Initialize with settings file path
   * @param config_path Path to settings file (default location if empty)
   * @return Success; a missing or corrupt file leaves the defaults in place
   */
  Result<void> init(const std::filesystem::path &config_path = {});

  /// Settings file path
  std::filesystem::path path() const;

  // ========================================================================
  // Configuration Access
  // ========================================================================

  /**
   * @brief Get a copy of the current configuration
   */
  ClipshareConfig get() const;

  /**
   * @brief Replace the configuration (not persisted until save())
   */
  Result<void> set(const ClipshareConfig &config);

  // ========================================================================
  // Persistence
  // ========================================================================

  /**
   * @brief Load configuration from file
   *
   * On failure the configuration is reset to defaults and the error is
   * returned.
   */
  Result<void> load();

  /**
   * @brief Save configuration to file, creating parent directories
   */
  Result<void> save();

  /**
   * @brief Reset to defaults
   */
  void reset_defaults();

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clipshare

#endif // CLIPSHARE_CONFIG_H
