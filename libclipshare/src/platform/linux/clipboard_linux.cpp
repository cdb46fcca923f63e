/**
 * @file clipboard_linux.cpp
 * @brief xclip command primitives
 *
 * Every call goes through build_invocation() so that the cached display
 * and authority context reach the helper even under sudo.
 */

#include "clipboard_linux.h"
#include "clipshare/logging.h"
#include "process_linux.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace clipshare {
namespace platform {

namespace {

std::vector<std::string> selection_args(const ClipboardEnvironment &env) {
  return {"-selection", env.selection};
}

bool is_executable_file(const fs::path &path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

} // namespace

// ============================================================================
// Helper Discovery
// ============================================================================

std::string find_helper(const ClipboardEnvironmentOptions &options) {
  std::error_code ec;

  // Bundled binary first
  if (!options.bundled_helper.empty() &&
      fs::is_regular_file(options.bundled_helper, ec)) {
    auto perms = fs::status(options.bundled_helper, ec).permissions();
    if (!ec && (perms & fs::perms::owner_exec) == fs::perms::none) {
      fs::permissions(options.bundled_helper,
                      fs::perms::owner_exec | fs::perms::group_exec |
                          fs::perms::others_exec,
                      fs::perm_options::add, ec);
      if (ec) {
        CLIPSHARE_LOG_ERROR("Failed to set permissions on {}: {}",
                            options.bundled_helper.string(), ec.message());
      } else {
        CLIPSHARE_LOG_DEBUG("Set executable permission on {}",
                            options.bundled_helper.string());
      }
    }
    return options.bundled_helper.string();
  }

  // System paths
  for (const auto &candidate : options.system_helpers) {
    if (candidate.empty()) {
      continue;
    }
    if (candidate.front() == '/') {
      if (is_executable_file(candidate)) {
        return candidate;
      }
    } else {
      auto found = find_in_path(candidate);
      if (!found.empty()) {
        return found;
      }
    }
  }

  return "";
}

// ============================================================================
// xclip Commands
// ============================================================================

Result<std::string> query_targets(const ClipboardEnvironment &env) {
  auto args = selection_args(env);
  args.insert(args.end(), {"-t", "TARGETS", "-o"});

  ProcessOptions options;
  options.timeout = env.timeouts.targets;

  auto result = run_process(build_invocation(env, args), options);
  if (result.is_error()) {
    CLIPSHARE_LOG_DEBUG("Failed to query clipboard targets: {}",
                        result.error().to_string());
    return result.error();
  }

  const auto &out = result.value().stdout_data;
  return std::string(out.begin(), out.end());
}

Result<Bytes> read_target(const ClipboardEnvironment &env,
                          const std::string &target,
                          std::chrono::milliseconds timeout) {
  auto args = selection_args(env);
  if (!target.empty()) {
    args.insert(args.end(), {"-t", target});
  }
  args.push_back("-o");

  ProcessOptions options;
  options.timeout = timeout;

  auto result = run_process(build_invocation(env, args), options);
  if (result.is_error()) {
    return result.error();
  }
  return std::move(result.value().stdout_data);
}

Result<void> write_from_file(const ClipboardEnvironment &env,
                             const fs::path &file,
                             const std::string &mime_type,
                             std::chrono::milliseconds timeout) {
  auto args = selection_args(env);
  args.insert(args.end(), {"-t", mime_type, "-i", file.string()});

  ProcessOptions options;
  options.timeout = timeout;
  options.capture_output = false;

  auto result = run_process(build_invocation(env, args), options);
  if (result.is_error()) {
    return result.error();
  }
  return Result<void>::ok();
}

// ============================================================================
// TempFile
// ============================================================================

TempFile::~TempFile() {
  if (path_.empty()) {
    return;
  }
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    CLIPSHARE_LOG_WARNING("Failed to remove {}: {}", path_.string(),
                          ec.message());
  }
}

Result<void> TempFile::create(const Bytes &data) {
  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec) {
    dir = "/tmp";
  }

  std::string name_template = (dir / "clipshare-XXXXXX").string();
  int fd = ::mkstemp(name_template.data());
  if (fd < 0) {
    return Error(ErrorCode::FileWriteError, "Failed to create temporary file",
                 std::strerror(errno));
  }
  path_ = name_template;

  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      int saved = errno;
      ::close(fd);
      return Error(ErrorCode::FileWriteError,
                   "Failed to write temporary file", std::strerror(saved));
    }
    written += static_cast<size_t>(n);
  }

  // The helper may run as another user
  if (::fchmod(fd, 0644) != 0) {
    int saved = errno;
    ::close(fd);
    return Error(ErrorCode::FileWriteError,
                 "Failed to make temporary file readable",
                 std::strerror(saved));
  }

  if (::close(fd) != 0) {
    return Error(ErrorCode::FileWriteError, "Failed to close temporary file",
                 std::strerror(errno));
  }

  return Result<void>::ok();
}

} // namespace platform
} // namespace clipshare
