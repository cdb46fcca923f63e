/**
 * @file fakes.h
 * @brief Test doubles shared by the clipshare test suites
 */

#ifndef CLIPSHARE_TESTS_FAKES_H
#define CLIPSHARE_TESTS_FAKES_H

#include <clipshare/broadcast.h>
#include <clipshare/clipboard.h>
#include <clipshare/encoding.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace clipshare {
namespace test {

// ============================================================================
// In-memory clipboard
// ============================================================================

/**
 * @brief ClipboardAdapter over a single in-memory snapshot
 */
class FakeClipboard : public ClipboardAdapter {
public:
  bool is_available() override { return available; }

  Result<ClipboardSnapshot> try_read() override {
    ++reads;
    std::lock_guard<std::mutex> lock(mutex);
    if (fail_reads) {
      return Error(ErrorCode::Timeout, "Command timed out");
    }
    return snapshot;
  }

  Result<void> write(const std::string &content, const std::string &mime_type,
                     bool is_encoded) override {
    std::lock_guard<std::mutex> lock(mutex);
    if (!available) {
      return Error(ErrorCode::UtilityUnavailable, "xclip not available");
    }
    if (is_encoded) {
      auto decoded = base64_decode(content);
      if (decoded.is_error()) {
        return decoded.error();
      }
    }
    snapshot.content = content;
    snapshot.mime_type = mime_type;
    snapshot.is_binary = is_encoded;
    return Result<void>::ok();
  }

  void set(ClipboardSnapshot value) {
    std::lock_guard<std::mutex> lock(mutex);
    snapshot = std::move(value);
  }

  void set_failing(bool failing) {
    std::lock_guard<std::mutex> lock(mutex);
    fail_reads = failing;
  }

  std::atomic<bool> available{true};
  std::atomic<int> reads{0};

private:
  std::mutex mutex;
  ClipboardSnapshot snapshot;
  bool fail_reads = false;
};

// ============================================================================
// Live client
// ============================================================================

/**
 * @brief LiveClient that records messages, or fails every send
 */
class FakeClient : public LiveClient {
public:
  explicit FakeClient(bool failing = false) : fail(failing) {}

  Result<void> send_text(const std::string &message) override {
    if (fail) {
      return Error(ErrorCode::NetworkSendError, "Broken pipe");
    }
    std::lock_guard<std::mutex> lock(mutex);
    messages.push_back(message);
    return Result<void>::ok();
  }

  void close() override { closed = true; }

  std::vector<std::string> received() {
    std::lock_guard<std::mutex> lock(mutex);
    return messages;
  }

  std::atomic<bool> fail{false};
  std::atomic<bool> closed{false};

private:
  std::mutex mutex;
  std::vector<std::string> messages;
};

// ============================================================================
// Scratch directory
// ============================================================================

/**
 * @brief Unique temporary directory removed on destruction
 */
class TempDir {
public:
  TempDir() {
    std::string name =
        (std::filesystem::temp_directory_path() / "clipshare-test-XXXXXX")
            .string();
    if (::mkdtemp(name.data()) != nullptr) {
      path_ = name;
    }
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &path() const { return path_; }

  std::filesystem::path write_file(const std::string &name,
                                   const std::string &content) const {
    auto file = path_ / name;
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    out << content;
    return file;
  }

private:
  std::filesystem::path path_;
};

// ============================================================================
// Fake xclip
// ============================================================================

/**
 * @brief Shell script standing in for xclip
 *
 * Understands the subset of options the adapter uses and keeps the
 * clipboard in files next to the script. Writing a number of seconds to
 * the "delay" file makes every invocation sleep first.
 */
class FakeXclip {
public:
  FakeXclip() {
    helper_ = dir_.path() / "xclip";
    std::ofstream script(helper_);
    script << "#!/bin/sh\n"
              "DIR=\"" << dir_.path().string() << "\"\n"
              "if [ -f \"$DIR/delay\" ]; then sleep \"$(cat \"$DIR/delay\")\"; fi\n"
              "echo \"$@\" >> \"$DIR/calls\"\n"
              "target=\"\"; mode=\"\"; file=\"\"\n"
              "while [ $# -gt 0 ]; do\n"
              "  case \"$1\" in\n"
              "    -selection) shift 2 ;;\n"
              "    -t) target=\"$2\"; shift 2 ;;\n"
              "    -o) mode=out; shift ;;\n"
              "    -i) mode=in; file=\"$2\"; shift 2 ;;\n"
              "    *) shift ;;\n"
              "  esac\n"
              "done\n"
              "if [ \"$mode\" = in ]; then\n"
              "  cp \"$file\" \"$DIR/data\" || exit 1\n"
              "  printf '%s' \"${target:-text/plain}\" > \"$DIR/type\"\n"
              "  exit 0\n"
              "fi\n"
              "if [ ! -f \"$DIR/data\" ]; then\n"
              "  [ \"$target\" = TARGETS ] && exit 0\n"
              "  echo \"Error: target ${target:-STRING} not available\" >&2\n"
              "  exit 1\n"
              "fi\n"
              "type=$(cat \"$DIR/type\")\n"
              "if [ \"$target\" = TARGETS ]; then\n"
              "  echo TARGETS\n"
              "  echo \"$type\"\n"
              "  case \"$type\" in text/*) echo UTF8_STRING; echo STRING ;; esac\n"
              "  exit 0\n"
              "fi\n"
              "case \"$target\" in\n"
              "  \"\"|\"$type\") ;;\n"
              "  UTF8_STRING|STRING|text/plain)\n"
              "    case \"$type\" in text/*) ;; *) exit 1 ;; esac ;;\n"
              "  *) echo \"Error: target $target not available\" >&2; exit 1 ;;\n"
              "esac\n"
              "cat \"$DIR/data\"\n";
    script.close();

    std::filesystem::permissions(helper_,
                                 std::filesystem::perms::owner_all |
                                     std::filesystem::perms::group_read |
                                     std::filesystem::perms::group_exec |
                                     std::filesystem::perms::others_read |
                                     std::filesystem::perms::others_exec);
  }

  /// Environment running the script directly with short timeouts
  ClipboardEnvironment environment(
      std::chrono::milliseconds timeout = std::chrono::seconds(5)) const {
    ClipboardEnvironment env;
    env.helper_path = helper_.string();
    env.display = ":0";
    env.run_as_user.clear();
    env.timeouts.targets = timeout;
    env.timeouts.text = timeout;
    env.timeouts.image = timeout;
    return env;
  }

  /// Resolution inputs that pick the script as the bundled helper
  ClipboardEnvironmentOptions options() const {
    ClipboardEnvironmentOptions opts;
    opts.bundled_helper = helper_;
    opts.system_helpers.clear();
    opts.session_env_file = dir_.path() / "no-session";
    opts.authority_file = dir_.path() / "no-xauthority";
    opts.run_as_user.clear();
    return opts;
  }

  /// Preload the clipboard
  void set_content(const std::string &data, const std::string &type) const {
    dir_.write_file("data", data);
    dir_.write_file("type", type);
  }

  /// Make every invocation sleep first
  void set_delay(const std::string &seconds) const {
    dir_.write_file("delay", seconds);
  }

  void clear_delay() const {
    std::error_code ec;
    std::filesystem::remove(dir_.path() / "delay", ec);
  }

  std::string stored_content() const { return read("data"); }
  std::string stored_type() const { return read("type"); }
  std::string calls() const { return read("calls"); }

  const std::filesystem::path &helper() const { return helper_; }
  const std::filesystem::path &directory() const { return dir_.path(); }

private:
  std::string read(const std::string &name) const {
    std::ifstream in(dir_.path() / name, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
  }

  TempDir dir_;
  std::filesystem::path helper_;
};

} // namespace test
} // namespace clipshare

#endif // CLIPSHARE_TESTS_FAKES_H
