/**
 * @file config.cpp
 * @brief Configuration management implementation
 */

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

#include <pwd.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "clipshare/config.h"
#include "clipshare/history.h"
#include "clipshare/logging.h"

namespace fs = ::std::filesystem;
using json = nlohmann::json;

namespace clipshare {

namespace {

constexpr const char *SETTINGS_FILE = "settings.json";

// Keep the default on a type mismatch
template <typename T>
void read_key(const json &j, const char *key, T &field) {
  auto it = j.find(key);
  if (it == j.end()) {
    return;
  }
  try {
    field = it->get<T>();
  } catch (const json::exception &) {
    CLIPSHARE_LOG_WARNING("Ignoring setting '{}': unexpected type {}", key,
                          it->type_name());
  }
}

// Booleans and numbers are distinct JSON types; get<int>() would accept
// true as 1
void read_bool(const json &j, const char *key, bool &field) {
  auto it = j.find(key);
  if (it == j.end()) {
    return;
  }
  if (!it->is_boolean()) {
    CLIPSHARE_LOG_WARNING("Ignoring setting '{}': expected boolean", key);
    return;
  }
  field = it->get<bool>();
}

template <typename T>
void read_number(const json &j, const char *key, T &field) {
  auto it = j.find(key);
  if (it == j.end()) {
    return;
  }
  if (!it->is_number()) {
    CLIPSHARE_LOG_WARNING("Ignoring setting '{}': expected number", key);
    return;
  }
  read_key(j, key, field);
}

} // namespace

// ============================================================================
// ClipshareConfig Methods
// ============================================================================

void ClipshareConfig::load_defaults() { *this = ClipshareConfig{}; }

Result<void> ClipshareConfig::validate() const {
  if (port < 1024 || port > 65535) {
    return Error(ErrorCode::ConfigInvalid,
                 "Port must be between 1024 and 65535");
  }

  if (max_history < 1 ||
      max_history > static_cast<int>(HistoryStore::DEFAULT_CAPACITY)) {
    return Error(ErrorCode::ConfigInvalid,
                 "max_history must be between 1 and " +
                     std::to_string(HistoryStore::DEFAULT_CAPACITY));
  }

  if (!(monitor_interval > 0) || monitor_interval > MAX_MONITOR_INTERVAL) {
    return Error(ErrorCode::ConfigInvalid,
                 "monitor_interval must be positive and at most " +
                     std::to_string(static_cast<int>(MAX_MONITOR_INTERVAL)) +
                     " seconds");
  }

  if (refresh_interval < 1) {
    return Error(ErrorCode::ConfigInvalid,
                 "refresh_interval must be at least 1 second");
  }

  return Result<void>::ok();
}

std::chrono::milliseconds ClipshareConfig::monitor_period() const {
  double seconds = std::min(monitor_interval, MAX_MONITOR_INTERVAL);
  if (!(seconds > 0)) {
    seconds = 0;
  }
  return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

bool ClipshareConfig::operator==(const ClipshareConfig &other) const {
  return auto_start == other.auto_start && port == other.port &&
         refresh_interval == other.refresh_interval &&
         monitor_interval == other.monitor_interval &&
         enable_history == other.enable_history &&
         max_history == other.max_history;
}

std::string ClipshareConfig::to_json() const {
  json j = {{"auto_start", auto_start},
            {"refresh_interval", refresh_interval},
            {"max_history", max_history},
            {"port", port},
            {"enable_history", enable_history},
            {"monitor_interval", monitor_interval}};
  return j.dump(2);
}

Result<ClipshareConfig> ClipshareConfig::from_json(const std::string &text) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded()) {
    return Error(ErrorCode::ConfigParseError, "Settings are not valid JSON");
  }
  if (!j.is_object()) {
    return Error(ErrorCode::ConfigParseError,
                 "Settings must be a JSON object");
  }

  ClipshareConfig config;
  read_bool(j, "auto_start", config.auto_start);
  read_number(j, "refresh_interval", config.refresh_interval);
  read_number(j, "max_history", config.max_history);
  read_number(j, "port", config.port);
  read_bool(j, "enable_history", config.enable_history);
  read_number(j, "monitor_interval", config.monitor_interval);
  return config;
}

fs::path ClipshareConfig::get_default_config_dir() {
  // Use XDG_CONFIG_HOME or ~/.config
  const char *xdg_config = std::getenv("XDG_CONFIG_HOME");
  if (xdg_config && *xdg_config) {
    return fs::path(xdg_config) / "clipshare";
  }

  const char *home = std::getenv("HOME");
  if (!home) {
    struct passwd *pw = getpwuid(getuid());
    if (pw) {
      home = pw->pw_dir;
    }
  }
  if (home) {
    return fs::path(home) / ".config" / "clipshare";
  }

  return fs::path("/tmp/clipshare");
}

fs::path ClipshareConfig::get_default_settings_path() {
  return get_default_config_dir() / SETTINGS_FILE;
}

// ============================================================================
// ConfigManager Implementation
// ============================================================================

class ConfigManager::Impl {
public:
  ClipshareConfig config;
  fs::path config_path;
  mutable std::mutex mutex;

  Result<void> load_locked();
};

ConfigManager::ConfigManager() : impl_(std::make_unique<Impl>()) {
  impl_->config_path = ClipshareConfig::get_default_settings_path();
}

ConfigManager::~ConfigManager() = default;

Result<void> ConfigManager::init(const fs::path &config_path) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  impl_->config_path = config_path.empty()
                           ? ClipshareConfig::get_default_settings_path()
                           : config_path;

  std::error_code ec;
  if (fs::exists(impl_->config_path, ec)) {
    auto result = impl_->load_locked();
    if (result.is_error()) {
      CLIPSHARE_LOG_ERROR("Failed to load settings: {}",
                          result.error().to_string());
    }
  } else {
    impl_->config.load_defaults();
  }

  return Result<void>::ok();
}

fs::path ConfigManager::path() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->config_path;
}

ClipshareConfig ConfigManager::get() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->config;
}

Result<void> ConfigManager::set(const ClipshareConfig &config) {
  auto validation = config.validate();
  if (validation.is_error()) {
    return validation;
  }

  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config = config;
  return Result<void>::ok();
}

Result<void> ConfigManager::load() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->load_locked();
}

Result<void> ConfigManager::Impl::load_locked() {
  config.load_defaults();

  std::ifstream file(config_path);
  if (!file) {
    return Error(ErrorCode::FileReadError, "Cannot open settings file",
                 config_path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  auto parsed = ClipshareConfig::from_json(buffer.str());
  if (parsed.is_error()) {
    parsed.error().details = config_path.string();
    return parsed.error();
  }

  auto validation = parsed.value().validate();
  if (validation.is_error()) {
    return validation;
  }

  config = parsed.value();
  return Result<void>::ok();
}

Result<void> ConfigManager::save() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  std::error_code ec;
  auto dir = impl_->config_path.parent_path();
  if (!dir.empty()) {
    fs::create_directories(dir, ec);
    if (ec) {
      return Error(ErrorCode::FileWriteError,
                   "Cannot create settings directory", ec.message());
    }
  }

  std::ofstream file(impl_->config_path, std::ios::trunc);
  if (!file) {
    return Error(ErrorCode::FileWriteError, "Cannot open settings file",
                 impl_->config_path.string());
  }

  file << impl_->config.to_json() << '\n';
  file.close();
  if (!file) {
    return Error(ErrorCode::FileWriteError, "Failed to write settings file",
                 impl_->config_path.string());
  }

  return Result<void>::ok();
}

void ConfigManager::reset_defaults() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config.load_defaults();
}

} // namespace clipshare
