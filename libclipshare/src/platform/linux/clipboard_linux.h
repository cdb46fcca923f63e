/**
 * @file clipboard_linux.h
 * @brief xclip command primitives and internal declarations
 */

#ifndef CLIPSHARE_PLATFORM_LINUX_CLIPBOARD_LINUX_H
#define CLIPSHARE_PLATFORM_LINUX_CLIPBOARD_LINUX_H

#include "clipshare/clipboard.h"
#include "clipshare/error.h"
#include <chrono>
#include <filesystem>
#include <string>

namespace clipshare {
namespace platform {

/**
 * @brief Locate the helper binary
 *
 * The bundled helper wins when it exists (execute bits are added if
 * missing); otherwise the system candidates are probed in order.
 * @return Helper path, or empty when none is usable
 */
std::string find_helper(const ClipboardEnvironmentOptions &options);

/**
 * @brief Query advertised targets (`-t TARGETS -o`)
 * @return Raw whitespace separated target list
 */
Result<std::string> query_targets(const ClipboardEnvironment &env);

/**
 * @brief Read one target, or the default target when @p target is empty
 */
Result<Bytes> read_target(const ClipboardEnvironment &env,
                          const std::string &target,
                          std::chrono::milliseconds timeout);

/**
 * @brief Set the clipboard from a file (`-t <mime> -i <file>`)
 *
 * Output is discarded since xclip forks to serve the selection.
 */
Result<void> write_from_file(const ClipboardEnvironment &env,
                             const std::filesystem::path &file,
                             const std::string &mime_type,
                             std::chrono::milliseconds timeout);

/**
 * @brief Temporary file removed when the object goes out of scope
 */
class TempFile {
public:
  TempFile() = default;
  ~TempFile();

  TempFile(const TempFile &) = delete;
  TempFile &operator=(const TempFile &) = delete;

  /**
   * @brief Create the file, fill it and make it world-readable
   */
  Result<void> create(const Bytes &data);

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace platform
} // namespace clipshare

#endif // CLIPSHARE_PLATFORM_LINUX_CLIPBOARD_LINUX_H
