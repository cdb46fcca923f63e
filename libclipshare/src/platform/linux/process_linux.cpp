/**
 * @file process_linux.cpp
 * @brief Bounded subprocess execution with Boost.Process
 */

#include "process_linux.h"
#include "clipshare/logging.h"

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>
#include <future>
#include <mutex>
#include <system_error>
#include <vector>

namespace bp = boost::process;

namespace clipshare {
namespace platform {

namespace {

boost::filesystem::path resolve_program(const std::string &program) {
  boost::filesystem::path path(program);
  if (path.is_absolute()) {
    boost::system::error_code ec;
    return boost::filesystem::exists(path, ec) ? path
                                               : boost::filesystem::path();
  }
  return bp::search_path(program);
}

Error timeout_error(const Invocation &invocation) {
  CLIPSHARE_LOG_ERROR("Command timeout: {}", invocation.to_string());
  return Error(ErrorCode::Timeout, "Command timed out", invocation.program);
}

// One helper at a time. Each run owns an io_context whose SIGCHLD
// handler reaps any exited child, including another run's.
std::mutex process_slot;

Error exit_error(int exit_code, std::string stderr_text) {
  return Error(ErrorCode::ExternalProcessError,
               "Helper exited with code " + std::to_string(exit_code),
               std::move(stderr_text));
}

} // namespace

std::string find_in_path(const std::string &name) {
  return bp::search_path(name).string();
}

Result<ProcessOutput> run_process(const Invocation &invocation,
                                  const ProcessOptions &options) {
  auto exe = resolve_program(invocation.program);
  if (exe.empty()) {
    CLIPSHARE_LOG_ERROR("Command error: {} not found", invocation.program);
    return Error(ErrorCode::ExternalProcessError,
                 "Executable not found: " + invocation.program);
  }

  std::lock_guard<std::mutex> slot(process_slot);

  ProcessOutput output;
  std::error_code ec;

  if (!options.capture_output) {
    bp::child child(exe, bp::args(invocation.args), bp::std_in < bp::null,
                    bp::std_out > bp::null, bp::std_err > bp::null, ec);
    if (ec) {
      CLIPSHARE_LOG_ERROR("Command error: {}", ec.message());
      return Error(ErrorCode::ExternalProcessError, "Failed to launch helper",
                   ec.message());
    }

    if (!child.wait_for(options.timeout, ec)) {
      std::error_code kill_ec;
      child.terminate(kill_ec);
      return timeout_error(invocation);
    }
    if (ec) {
      return Error(ErrorCode::ExternalProcessError, "Failed to wait for helper",
                   ec.message());
    }

    output.exit_code = child.exit_code();
    if (output.exit_code != 0) {
      return exit_error(output.exit_code, "");
    }
    return output;
  }

  // Async pipes drained by the io_context avoid deadlocks on full buffers
  boost::asio::io_context ios;
  std::future<std::vector<char>> out;
  std::future<std::string> err;

  bp::child child(exe, bp::args(invocation.args), bp::std_in < bp::null,
                  bp::std_out > out, bp::std_err > err, ios, ec);
  if (ec) {
    CLIPSHARE_LOG_ERROR("Command error: {}", ec.message());
    return Error(ErrorCode::ExternalProcessError, "Failed to launch helper",
                 ec.message());
  }

  ios.run_for(options.timeout);

  bool still_running = child.running(ec);
  if (ec) {
    return Error(ErrorCode::ExternalProcessError, "Failed to wait for helper",
                 ec.message());
  }
  if (still_running) {
    std::error_code kill_ec;
    child.terminate(kill_ec);
    return timeout_error(invocation);
  }

  // The exit status is already collected, wait() only detaches
  child.wait(ec);

  try {
    auto stdout_chars = out.get();
    output.stdout_data.assign(stdout_chars.begin(), stdout_chars.end());
    output.stderr_text = err.get();
  } catch (const std::exception &ex) {
    return Error(ErrorCode::ExternalProcessError,
                 "Failed to collect helper output", ex.what());
  }

  output.exit_code = child.exit_code();
  if (output.exit_code != 0) {
    return exit_error(output.exit_code, output.stderr_text);
  }

  return output;
}

} // namespace platform
} // namespace clipshare
