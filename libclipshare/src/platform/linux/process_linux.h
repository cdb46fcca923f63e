/**
 * @file process_linux.h
 * @brief Bounded subprocess execution
 *
 * Internal helper used by the clipboard adapter to run the external
 * helper with a hard timeout.
 */

#ifndef CLIPSHARE_PLATFORM_LINUX_PROCESS_LINUX_H
#define CLIPSHARE_PLATFORM_LINUX_PROCESS_LINUX_H

#include "clipshare/clipboard.h"
#include "clipshare/error.h"
#include "clipshare/types.h"
#include <chrono>
#include <string>

namespace clipshare {
namespace platform {

/**
 * @brief How to run a subprocess
 */
struct ProcessOptions {
  /// Hard limit; the process is killed when it is exceeded
  std::chrono::milliseconds timeout{std::chrono::seconds(15)};

  /// Capture stdout/stderr. When false both are discarded, which is
  /// required for helpers that fork and keep the pipes open.
  bool capture_output = true;
};

/**
 * @brief Output of a successful subprocess run
 */
struct ProcessOutput {
  int exit_code = 0;
  Bytes stdout_data;
  std::string stderr_text;
};

/**
 * @brief Run a program and wait for it within the timeout
 * @return Output on exit code 0; Timeout when the limit was exceeded;
 *         ExternalProcessError on launch failure or non-zero exit
 */
Result<ProcessOutput> run_process(const Invocation &invocation,
                                  const ProcessOptions &options);

/**
 * @brief Find a program on PATH
 * @return Absolute path, or empty if not found
 */
std::string find_in_path(const std::string &name);

} // namespace platform
} // namespace clipshare

#endif // CLIPSHARE_PLATFORM_LINUX_PROCESS_LINUX_H
