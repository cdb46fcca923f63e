/**
 * @file clipshare.cpp
 * @brief Main ClipShare class implementation
 */

#include "clipshare/clipshare.h"
#include "clipshare/encoding.h"
#include "clipshare/logging.h"

#include <mutex>

namespace clipshare {

// ============================================================================
// Version & State
// ============================================================================

VersionInfo get_version() { return VersionInfo{}; }

const char *service_state_name(ServiceState state) {
  switch (state) {
  case ServiceState::Uninitialized:
    return "Uninitialized";
  case ServiceState::Idle:
    return "Idle";
  case ServiceState::Running:
    return "Running";
  default:
    return "Unknown";
  }
}

// ============================================================================
// ClipShare Implementation
// ============================================================================

class ClipShare::Impl {
public:
  void set_state(ServiceState next) {
    if (state != next) {
      CLIPSHARE_LOG_DEBUG("Service: {} -> {}", service_state_name(state),
                          service_state_name(next));
      state = next;
    }
  }

  ServiceState state = ServiceState::Uninitialized;
  ServiceOptions options;
  ClipshareConfig config;
  uint16_t server_port = 8765;
  mutable std::mutex mutex;

  // Subsystems
  ConfigManager config_manager;
  std::unique_ptr<ClipboardAdapter> adapter;
  HistoryStore history;
  // Shared so that a clipboard call outlives a concurrent shutdown()
  std::shared_ptr<BroadcastHub> hub;
  std::unique_ptr<ClipboardMonitor> monitor;
  std::unique_ptr<WebServer> server;

  std::shared_ptr<BroadcastHub> current_hub() const {
    std::lock_guard<std::mutex> lock(mutex);
    return hub;
  }

  void apply_live_settings() {
    hub->set_history_enabled(config.enable_history);
    monitor->set_interval(config.monitor_period());
  }

  Result<std::string> start_server_locked() {
    if (server->is_running()) {
      return make_server_url(get_local_ip(), server->port());
    }

    auto result = server->start(server_port, options.bind_address);
    if (result.is_error()) {
      CLIPSHARE_LOG_ERROR("Failed to start server: {}",
                          result.error().to_string());
      return result.error();
    }
    return make_server_url(get_local_ip(), server->port());
  }

  void stop_locked() {
    if (monitor) {
      monitor->stop();
    }
    if (server) {
      server->stop();
    }
    if (state == ServiceState::Running) {
      set_state(ServiceState::Idle);
    }
  }
};

ClipShare::ClipShare() : impl_(std::make_unique<Impl>()) {}

ClipShare::ClipShare(std::unique_ptr<ClipboardAdapter> adapter)
    : impl_(std::make_unique<Impl>()) {
  impl_->adapter = std::move(adapter);
}

ClipShare::~ClipShare() { shutdown(); }

// ============================================================================
// Lifecycle
// ============================================================================

Result<void> ClipShare::init(const ServiceOptions &options) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (impl_->state != ServiceState::Uninitialized) {
    return Error(ErrorCode::AlreadyInitialized, "ClipShare already initialized");
  }

  CLIPSHARE_TRY(encoding_init());

  impl_->options = options;

  // A missing or corrupt settings file leaves the defaults in place
  CLIPSHARE_TRY(impl_->config_manager.init(options.settings_path));
  impl_->config = impl_->config_manager.get();
  impl_->server_port = options.port_override.value_or(
      static_cast<uint16_t>(impl_->config.port));

  if (!impl_->adapter) {
    impl_->adapter = std::make_unique<XclipClipboard>(options.clipboard);
  }

  impl_->hub = std::make_shared<BroadcastHub>(*impl_->adapter, impl_->history);
  impl_->monitor =
      std::make_unique<ClipboardMonitor>(*impl_->adapter, *impl_->hub);
  impl_->server =
      std::make_unique<WebServer>(*impl_->hub, options.frontend_dir);
  impl_->apply_live_settings();

  impl_->set_state(ServiceState::Idle);
  return Result<void>::ok();
}

void ClipShare::shutdown() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (impl_->state == ServiceState::Uninitialized) {
    return;
  }

  impl_->stop_locked();

  // Dependents first
  impl_->server.reset();
  impl_->monitor.reset();
  impl_->hub.reset();

  impl_->set_state(ServiceState::Uninitialized);
}

bool ClipShare::is_initialized() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->state != ServiceState::Uninitialized;
}

ServiceState ClipShare::get_state() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->state;
}

Result<void> ClipShare::start() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (impl_->state == ServiceState::Uninitialized) {
    return Error(ErrorCode::NotInitialized, "ClipShare not initialized");
  }

  auto version = get_version();
  CLIPSHARE_LOG_INFO("clipshare {} ({}, built {}) starting...",
                     version.version_string, CLIPSHARE_PLATFORM_NAME,
                     version.build_date);

  Result<void> server_result;
  if (impl_->config.auto_start) {
    auto url = impl_->start_server_locked();
    if (url.is_ok()) {
      CLIPSHARE_LOG_INFO("Web server at {}", url.value());
    } else {
      CLIPSHARE_LOG_ERROR("Server failed: {}", url.error().to_string());
      server_result = url.error();
    }
  } else {
    CLIPSHARE_LOG_INFO("Auto-start disabled, server not started");
  }

  if (!impl_->monitor->is_running()) {
    CLIPSHARE_TRY(impl_->monitor->start());
  }

  impl_->set_state(ServiceState::Running);
  return server_result;
}

void ClipShare::stop() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (impl_->state == ServiceState::Uninitialized) {
    return;
  }
  CLIPSHARE_LOG_INFO("clipshare stopping...");
  impl_->stop_locked();
}

// ============================================================================
// Server
// ============================================================================

Result<std::string> ClipShare::start_server() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (impl_->state == ServiceState::Uninitialized) {
    return Error(ErrorCode::NotInitialized, "ClipShare not initialized");
  }
  return impl_->start_server_locked();
}

void ClipShare::stop_server() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (impl_->server) {
    impl_->server->stop();
  }
}

Result<std::string> ClipShare::restart_server() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (impl_->state == ServiceState::Uninitialized) {
    return Error(ErrorCode::NotInitialized, "ClipShare not initialized");
  }

  if (impl_->server->is_running()) {
    impl_->server->stop();
    CLIPSHARE_LOG_INFO("Stopped server for restart");
  }

  // Reload settings to get latest port
  auto loaded = impl_->config_manager.load();
  if (loaded.is_error()) {
    CLIPSHARE_LOG_WARNING("Using default settings: {}",
                          loaded.error().to_string());
  }
  impl_->config = impl_->config_manager.get();
  impl_->server_port = static_cast<uint16_t>(impl_->config.port);
  impl_->apply_live_settings();

  auto url = impl_->start_server_locked();
  if (url.is_ok()) {
    CLIPSHARE_LOG_INFO("Server restarted on {}", url.value());
  }
  return url;
}

ServerStatus ClipShare::get_server_status() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  ServerStatus status;
  if (impl_->server) {
    status = impl_->server->status();
  } else {
    status.ip = get_local_ip();
    status.clipboard_available = impl_->adapter && impl_->adapter->is_available();
  }

  if (!status.running) {
    status.port = impl_->server_port;
    status.url = make_server_url(status.ip, status.port);
  }
  return status;
}

// ============================================================================
// Clipboard
// ============================================================================

ClipboardSnapshot ClipShare::get_clipboard() {
  auto hub = impl_->current_hub();
  if (!hub) {
    return ClipboardSnapshot::empty();
  }
  return hub->handle_read();
}

Result<void> ClipShare::set_clipboard(const std::string &content,
                                      const std::string &mime_type,
                                      bool is_base64) {
  auto hub = impl_->current_hub();
  CLIPSHARE_REQUIRE(hub != nullptr, ErrorCode::NotInitialized,
                    "ClipShare not initialized");
  return hub->handle_write(content, mime_type, is_base64);
}

Result<void> ClipShare::clear_clipboard() {
  return set_clipboard("", MIME_TEXT_PLAIN, false);
}

// ============================================================================
// Settings
// ============================================================================

ClipshareConfig ClipShare::get_settings() {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  std::error_code ec;
  if (std::filesystem::exists(impl_->config_manager.path(), ec)) {
    auto loaded = impl_->config_manager.load();
    if (loaded.is_error()) {
      CLIPSHARE_LOG_ERROR("Failed to load settings: {}",
                          loaded.error().to_string());
    }
  }
  impl_->config = impl_->config_manager.get();
  return impl_->config;
}

Result<void> ClipShare::save_settings(const ClipshareConfig &config) {
  std::lock_guard<std::mutex> lock(impl_->mutex);

  CLIPSHARE_TRY(impl_->config_manager.set(config));

  auto saved = impl_->config_manager.save();
  if (saved.is_error()) {
    CLIPSHARE_LOG_ERROR("Failed to save settings: {}",
                        saved.error().to_string());
    return saved;
  }

  impl_->config = config;
  if (impl_->hub) {
    impl_->apply_live_settings();
  }

  auto new_port = static_cast<uint16_t>(config.port);
  if (new_port != impl_->server_port) {
    CLIPSHARE_LOG_INFO("Port changed from {} to {}", impl_->server_port,
                       new_port);
    impl_->server_port = new_port;
  }

  return Result<void>::ok();
}

// ============================================================================
// History
// ============================================================================

std::vector<HistoryEntry> ClipShare::get_history() const {
  size_t limit = 0;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    limit = static_cast<size_t>(impl_->config.max_history);
  }
  return impl_->history.list(limit);
}

void ClipShare::clear_history() { impl_->history.clear(); }

Result<void> ClipShare::restore_history_item(const HistoryEntry &entry) {
  return set_clipboard(entry.content, entry.mime_type, entry.is_binary);
}

// ============================================================================
// Subsystems
// ============================================================================

ConfigManager &ClipShare::get_config_manager() {
  return impl_->config_manager;
}

ClipboardMonitor &ClipShare::get_monitor() { return *impl_->monitor; }

} // namespace clipshare
