/**
 * @file test_clipboard.cpp
 * @brief Unit tests for clipboard access
 */

#include "support/fakes.h"

#include <clipshare/clipboard.h>
#include <clipshare/encoding.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace clipshare;
using clipshare::test::FakeXclip;
using clipshare::test::TempDir;

namespace {

// 1x1 transparent PNG
const char *TINY_PNG_BASE64 =
    "iVBORw0KGgoAAAANSUhEUgAAAAEAAAABCAYAAAAfFcSJAAAADUlEQVR42mNkYPhfDwAChwGA"
    "60e6kgAAAABJRU5ErkJggg==";

} // namespace

// ============================================================================
// Invocation Tests
// ============================================================================

TEST(InvocationTest, WrapsHelperWithSudo) {
  ClipboardEnvironment env;
  env.helper_path = "/opt/clipshare/bin/xclip";
  env.display = ":1";
  env.authority_file = "/home/deck/.Xauthority";
  env.run_as_user = "deck";

  auto inv = build_invocation(env, {"-selection", "clipboard", "-o"});

  EXPECT_EQ(inv.program, "sudo");
  std::vector<std::string> expected = {
      "-u",         "deck",         "env",       "DISPLAY=:1",
      "XAUTHORITY=/home/deck/.Xauthority",        "/opt/clipshare/bin/xclip",
      "-selection", "clipboard",    "-o"};
  EXPECT_EQ(inv.args, expected);
}

TEST(InvocationTest, RunsDirectlyWithoutUser) {
  ClipboardEnvironment env;
  env.helper_path = "/usr/bin/xclip";
  env.display = ":0";

  auto inv = build_invocation(env, {"-o"});

  EXPECT_EQ(inv.program, "env");
  std::vector<std::string> expected = {"DISPLAY=:0", "/usr/bin/xclip", "-o"};
  EXPECT_EQ(inv.args, expected);
  EXPECT_EQ(inv.to_string(), "env DISPLAY=:0 /usr/bin/xclip -o");
}

// ============================================================================
// Target Negotiation Tests
// ============================================================================

TEST(TargetTest, ParseTargets) {
  auto targets = parse_targets("TARGETS\nUTF8_STRING\r\nSTRING\n\n");
  std::vector<std::string> expected = {"TARGETS", "UTF8_STRING", "STRING"};
  EXPECT_EQ(targets, expected);

  EXPECT_TRUE(parse_targets("").empty());
}

TEST(TargetTest, SelectsTextTargetByPriority) {
  EXPECT_EQ(select_text_target({"STRING", "text/plain", "UTF8_STRING"}),
            "UTF8_STRING");
  EXPECT_EQ(select_text_target({"STRING", "text/plain"}), "text/plain");
  EXPECT_EQ(select_text_target({"STRING", "text/uri-list"}), "text/uri-list");
  EXPECT_EQ(select_text_target({"TARGETS", "STRING"}), "STRING");
  EXPECT_EQ(select_text_target({"TARGETS", "image/png"}), "");
}

TEST(TargetTest, DetectsImageTargets) {
  EXPECT_TRUE(has_image_target({"TARGETS", "image/png"}));
  EXPECT_TRUE(has_image_target({"image/jpeg", "UTF8_STRING"}));
  EXPECT_FALSE(has_image_target({"image/gif"}));
  EXPECT_FALSE(has_image_target({"UTF8_STRING", "STRING"}));
}

// ============================================================================
// Session Descriptor Tests
// ============================================================================

class SessionDisplayTest : public ::testing::Test {
protected:
  TempDir dir;
};

TEST_F(SessionDisplayTest, ReadsDisplay) {
  auto file = dir.write_file("env", "XDG_RUNTIME_DIR=/run/user/1000\n"
                                    "DISPLAY=:1\n"
                                    "WAYLAND_DISPLAY=gamescope-0\n");
  auto display = read_session_display(file);
  ASSERT_TRUE(display.is_ok());
  EXPECT_EQ(display.value(), ":1");
}

TEST_F(SessionDisplayTest, StripsTrailingWhitespace) {
  auto file = dir.write_file("env", "DISPLAY=:2\r\n");
  auto display = read_session_display(file);
  ASSERT_TRUE(display.is_ok());
  EXPECT_EQ(display.value(), ":2");
}

TEST_F(SessionDisplayTest, MissingFile) {
  auto display = read_session_display(dir.path() / "absent");
  ASSERT_TRUE(display.is_error());
  EXPECT_EQ(display.error().code, ErrorCode::FileNotFound);
}

TEST_F(SessionDisplayTest, NoDisplayLine) {
  auto file = dir.write_file("env", "HOME=/home/deck\n");
  auto display = read_session_display(file);
  ASSERT_TRUE(display.is_error());
  EXPECT_EQ(display.error().code, ErrorCode::InvalidState);
}

// ============================================================================
// File Reference Tests
// ============================================================================

class FileUriTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto decoded = base64_decode(TINY_PNG_BASE64);
    ASSERT_TRUE(decoded.is_ok());
    png = decoded.value();
  }

  std::filesystem::path write_png(const std::string &name) {
    return dir.write_file(name, std::string(png.begin(), png.end()));
  }

  TempDir dir;
  Bytes png;
};

TEST_F(FileUriTest, ReadsImageFile) {
  auto file = write_png("shot.PNG");
  auto result = read_image_from_uri("file://" + file.string());
  ASSERT_TRUE(result.is_ok());

  const auto &snapshot = result.value();
  EXPECT_TRUE(snapshot.is_binary);
  EXPECT_EQ(snapshot.mime_type, "image/png");
  EXPECT_EQ(snapshot.content, TINY_PNG_BASE64);
}

TEST_F(FileUriTest, DecodesEscapedPath) {
  auto file = write_png("my shot.jpg");
  std::string uri = "file://" + dir.path().string() + "/my%20shot.jpg\n";

  auto result = read_image_from_uri(uri);
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(result.value().mime_type, "image/jpeg");
}

TEST_F(FileUriTest, IgnoresNonImageFiles) {
  auto file = dir.write_file("notes.txt", "hello");
  auto result = read_image_from_uri("file://" + file.string());
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::NotSupported);
}

TEST_F(FileUriTest, MissingFile) {
  auto result =
      read_image_from_uri("file://" + (dir.path() / "gone.png").string());
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::FileNotFound);
}

TEST_F(FileUriTest, RejectsOtherSchemes) {
  auto result = read_image_from_uri("https://example.com/a.png");
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
}

// ============================================================================
// Snapshot Tests
// ============================================================================

TEST(SnapshotTest, Constructors) {
  auto empty = ClipboardSnapshot::empty();
  EXPECT_TRUE(empty.is_empty());
  EXPECT_FALSE(empty.is_binary);
  EXPECT_EQ(empty.mime_type, "text/plain");

  auto text = ClipboardSnapshot::from_text("hello");
  EXPECT_EQ(text.content, "hello");
  EXPECT_FALSE(text.is_binary);

  auto image = ClipboardSnapshot::from_image(Bytes{'a', 'b', 'c'});
  EXPECT_EQ(image.content, "YWJj");
  EXPECT_EQ(image.mime_type, "image/png");
  EXPECT_TRUE(image.is_binary);

  EXPECT_NE(text, image);
  EXPECT_EQ(text, ClipboardSnapshot::from_text("hello"));
}

TEST(SnapshotTest, ImageMime) {
  EXPECT_TRUE(is_image_mime("image/png"));
  EXPECT_TRUE(is_image_mime("image/jpeg"));
  EXPECT_FALSE(is_image_mime("text/plain"));
  EXPECT_FALSE(is_image_mime(""));
}

// ============================================================================
// Environment Resolution Tests
// ============================================================================

TEST(EnvironmentTest, ResolvesBundledHelper) {
  FakeXclip xclip;
  auto env = resolve_environment(xclip.options());

  EXPECT_TRUE(env.is_available());
  EXPECT_EQ(env.helper_path, xclip.helper().string());
  EXPECT_EQ(env.display, ":0");
  EXPECT_TRUE(env.authority_file.empty());
  EXPECT_TRUE(env.run_as_user.empty());
}

TEST(EnvironmentTest, UsesSessionDisplayAndAuthority) {
  FakeXclip xclip;
  auto options = xclip.options();
  options.session_env_file = xclip.directory() / "session";
  std::ofstream(options.session_env_file) << "DISPLAY=:7\n";
  options.authority_file = xclip.helper();

  auto env = resolve_environment(options);
  EXPECT_EQ(env.display, ":7");
  EXPECT_EQ(env.authority_file, xclip.helper().string());
}

TEST(EnvironmentTest, NoHelperFound) {
  TempDir dir;
  ClipboardEnvironmentOptions options;
  options.bundled_helper = dir.path() / "missing-xclip";
  options.system_helpers = {(dir.path() / "also-missing").string()};
  options.session_env_file = dir.path() / "no-session";

  auto env = resolve_environment(options);
  EXPECT_FALSE(env.is_available());
}

TEST(EnvironmentTest, UnavailableAdapter) {
  ClipboardEnvironment env;
  env.helper_path.clear();
  XclipClipboard clipboard(env);

  EXPECT_FALSE(clipboard.is_available());

  auto read = clipboard.try_read();
  ASSERT_TRUE(read.is_error());
  EXPECT_EQ(read.error().code, ErrorCode::UtilityUnavailable);
  EXPECT_TRUE(clipboard.read().is_empty());

  auto written = clipboard.write("hello", "text/plain", false);
  ASSERT_TRUE(written.is_error());
  EXPECT_EQ(written.error().code, ErrorCode::UtilityUnavailable);
}

// ============================================================================
// xclip Adapter Tests
// ============================================================================

class XclipClipboardTest : public ::testing::Test {
protected:
  FakeXclip xclip;
};

TEST_F(XclipClipboardTest, TextRoundTrip) {
  XclipClipboard clipboard(xclip.environment());

  ASSERT_TRUE(clipboard.write("hello", "text/plain", false).is_ok());
  EXPECT_EQ(xclip.stored_content(), "hello");
  EXPECT_EQ(xclip.stored_type(), "text/plain");

  auto snapshot = clipboard.try_read();
  ASSERT_TRUE(snapshot.is_ok());
  EXPECT_EQ(snapshot.value().content, "hello");
  EXPECT_EQ(snapshot.value().mime_type, "text/plain");
  EXPECT_FALSE(snapshot.value().is_binary);
}

TEST_F(XclipClipboardTest, ImageRoundTrip) {
  XclipClipboard clipboard(xclip.environment());

  ASSERT_TRUE(clipboard.write(TINY_PNG_BASE64, "image/png", true).is_ok());
  EXPECT_EQ(xclip.stored_type(), "image/png");

  auto snapshot = clipboard.read();
  EXPECT_TRUE(snapshot.is_binary);
  EXPECT_EQ(snapshot.mime_type, "image/png");
  EXPECT_EQ(snapshot.content, TINY_PNG_BASE64);
}

TEST_F(XclipClipboardTest, EmptyMimeWritesText) {
  XclipClipboard clipboard(xclip.environment());
  ASSERT_TRUE(clipboard.write("abc", "", false).is_ok());
  EXPECT_EQ(xclip.stored_type(), "text/plain");
}

TEST_F(XclipClipboardTest, BadBase64NeverReachesHelper) {
  XclipClipboard clipboard(xclip.environment());

  auto result = clipboard.write("%%%not-base64%%%", "image/png", true);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::EncodingError);
  EXPECT_TRUE(xclip.calls().empty());
}

TEST_F(XclipClipboardTest, ProbesTargetsBeforeReading) {
  xclip.set_content("probe", "text/plain");
  XclipClipboard clipboard(xclip.environment());

  EXPECT_EQ(clipboard.read().content, "probe");

  auto calls = xclip.calls();
  EXPECT_EQ(calls.rfind("-selection clipboard -t TARGETS -o", 0), 0u);
  EXPECT_NE(calls.find("-t UTF8_STRING -o"), std::string::npos);
}

TEST_F(XclipClipboardTest, PrefersImageOverText) {
  auto png = base64_decode(TINY_PNG_BASE64);
  ASSERT_TRUE(png.is_ok());
  xclip.set_content(std::string(png.value().begin(), png.value().end()),
                    "image/png");
  XclipClipboard clipboard(xclip.environment());

  auto snapshot = clipboard.read();
  EXPECT_TRUE(snapshot.is_binary);
  EXPECT_EQ(snapshot.content, TINY_PNG_BASE64);
}

TEST_F(XclipClipboardTest, FileUriBecomesImage) {
  TempDir images;
  auto png = base64_decode(TINY_PNG_BASE64);
  ASSERT_TRUE(png.is_ok());
  auto file = images.write_file(
      "copied.png", std::string(png.value().begin(), png.value().end()));

  xclip.set_content("file://" + file.string(), "text/plain");
  XclipClipboard clipboard(xclip.environment());

  auto snapshot = clipboard.read();
  EXPECT_TRUE(snapshot.is_binary);
  EXPECT_EQ(snapshot.mime_type, "image/png");
  EXPECT_EQ(snapshot.content, TINY_PNG_BASE64);
}

TEST_F(XclipClipboardTest, FileUriToTextStaysText) {
  xclip.set_content("file:///nonexistent/readme.md", "text/plain");
  XclipClipboard clipboard(xclip.environment());

  auto snapshot = clipboard.read();
  EXPECT_FALSE(snapshot.is_binary);
  EXPECT_EQ(snapshot.content, "file:///nonexistent/readme.md");
}

TEST_F(XclipClipboardTest, InvalidUtf8IsDropped) {
  xclip.set_content("ok\xFF\xFE!", "text/plain");
  XclipClipboard clipboard(xclip.environment());
  EXPECT_EQ(clipboard.read().content, "ok!");
}

TEST_F(XclipClipboardTest, TimeoutYieldsEmptySnapshot) {
  xclip.set_content("slow", "text/plain");
  xclip.set_delay("3");
  XclipClipboard clipboard(xclip.environment(std::chrono::milliseconds(300)));

  auto start = std::chrono::steady_clock::now();
  auto result = clipboard.try_read();
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::Timeout);
  EXPECT_LT(elapsed, std::chrono::seconds(3));

  EXPECT_TRUE(clipboard.read().is_empty());
}

TEST_F(XclipClipboardTest, ConcurrentReadsSeeContent) {
  xclip.set_content("seed", "text/plain");
  XclipClipboard clipboard(xclip.environment());

  std::atomic<int> failures{0};
  std::vector<std::thread> readers;
  for (int t = 0; t < 4; ++t) {
    readers.emplace_back([&] {
      for (int i = 0; i < 15; ++i) {
        auto result = clipboard.try_read();
        if (result.is_error() || result.value().content != "seed") {
          ++failures;
        }
      }
    });
  }
  for (auto &reader : readers) {
    reader.join();
  }

  EXPECT_EQ(failures, 0);
}

TEST_F(XclipClipboardTest, ReadsOverlapWithWrites) {
  xclip.set_content("seed", "text/plain");
  XclipClipboard clipboard(xclip.environment());

  std::atomic<int> failures{0};
  std::thread writer([&] {
    for (int i = 0; i < 20; ++i) {
      if (clipboard.write("seed", "text/plain", false).is_error()) {
        ++failures;
      }
    }
  });
  for (int i = 0; i < 20; ++i) {
    auto result = clipboard.try_read();
    if (result.is_error() || result.value().content != "seed") {
      ++failures;
    }
  }
  writer.join();

  EXPECT_EQ(failures, 0);
}

// ============================================================================
// Write Path Tests
// ============================================================================

/**
 * @brief Points TMPDIR at a private directory to observe temporary files
 */
class XclipWriteTest : public ::testing::Test {
protected:
  void SetUp() override {
    const char *previous = std::getenv("TMPDIR");
    if (previous != nullptr) {
      saved_tmpdir = previous;
      had_tmpdir = true;
    }
    ::setenv("TMPDIR", scratch.path().c_str(), 1);
  }

  void TearDown() override {
    if (had_tmpdir) {
      ::setenv("TMPDIR", saved_tmpdir.c_str(), 1);
    } else {
      ::unsetenv("TMPDIR");
    }
  }

  /// Temporary files the adapter left behind
  std::vector<std::string> leftovers() const {
    std::vector<std::string> names;
    for (const auto &entry :
         std::filesystem::directory_iterator(scratch.path())) {
      auto name = entry.path().filename().string();
      if (name.rfind("clipshare-", 0) == 0) {
        names.push_back(name);
      }
    }
    return names;
  }

  FakeXclip xclip;
  TempDir scratch;
  std::string saved_tmpdir;
  bool had_tmpdir = false;
};

TEST_F(XclipWriteTest, SuccessRemovesTempFile) {
  XclipClipboard clipboard(xclip.environment());

  ASSERT_TRUE(clipboard.write("kept", "text/plain", false).is_ok());
  EXPECT_EQ(xclip.stored_content(), "kept");
  EXPECT_TRUE(leftovers().empty());
}

TEST_F(XclipWriteTest, HelperFailureRemovesTempFile) {
  auto failing = scratch.write_file("failing-xclip", "#!/bin/sh\nexit 3\n");
  std::filesystem::permissions(failing, std::filesystem::perms::owner_all);

  ClipboardEnvironment env = xclip.environment();
  env.helper_path = failing.string();
  XclipClipboard clipboard(env);

  auto result = clipboard.write("lost", "text/plain", false);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::ExternalProcessError);
  EXPECT_TRUE(leftovers().empty());
}

TEST_F(XclipWriteTest, TimeoutIsRecoverable) {
  xclip.set_delay("3");
  XclipClipboard clipboard(xclip.environment(std::chrono::milliseconds(300)));

  auto start = std::chrono::steady_clock::now();
  auto result = clipboard.write("late", "text/plain", false);
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::Timeout);
  EXPECT_TRUE(is_recoverable(result.error().code));
  EXPECT_LT(elapsed, std::chrono::seconds(3));
  EXPECT_TRUE(leftovers().empty());

  // The next write goes through once the helper responds again
  xclip.clear_delay();
  ASSERT_TRUE(clipboard.write("on time", "text/plain", false).is_ok());
  EXPECT_EQ(xclip.stored_content(), "on time");
}

TEST_F(XclipWriteTest, ImagesGetTheLongerTimeout) {
  ClipboardEnvironment env = xclip.environment();
  env.timeouts.text = std::chrono::milliseconds(300);
  env.timeouts.image = std::chrono::seconds(10);
  XclipClipboard clipboard(env);

  xclip.set_delay("1");

  auto image = clipboard.write(TINY_PNG_BASE64, "image/png", true);
  ASSERT_TRUE(image.is_ok()) << image.error().to_string();
  EXPECT_EQ(xclip.stored_type(), "image/png");

  auto text = clipboard.write("slow text", "text/plain", false);
  ASSERT_TRUE(text.is_error());
  EXPECT_EQ(text.error().code, ErrorCode::Timeout);
  EXPECT_TRUE(leftovers().empty());
}

TEST_F(XclipWriteTest, ConcurrentWritesStayWhole) {
  XclipClipboard clipboard(xclip.environment());
  const std::vector<std::string> values = {
      std::string(4096, 'a'), std::string(4096, 'b'), std::string(4096, 'c')};

  std::atomic<int> failures{0};
  std::vector<std::thread> writers;
  for (const auto &value : values) {
    writers.emplace_back([&clipboard, &failures, &value] {
      for (int i = 0; i < 5; ++i) {
        if (clipboard.write(value, "text/plain", false).is_error()) {
          ++failures;
        }
      }
    });
  }
  for (auto &writer : writers) {
    writer.join();
  }

  EXPECT_EQ(failures, 0);
  auto stored = xclip.stored_content();
  EXPECT_NE(std::find(values.begin(), values.end(), stored), values.end());
  EXPECT_TRUE(leftovers().empty());
}

TEST_F(XclipClipboardTest, ResolvesLazilyFromOptions) {
  xclip.set_content("lazy", "text/plain");
  XclipClipboard clipboard(xclip.options());

  EXPECT_TRUE(clipboard.is_available());
  EXPECT_EQ(clipboard.environment().helper_path, xclip.helper().string());
  EXPECT_EQ(clipboard.read().content, "lazy");
}
