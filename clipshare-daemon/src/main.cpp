/**
 * @file main.cpp
 * @brief clipshare daemon entry point
 */

#include <clipshare/clipshare.h>
#include <clipshare/logging.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_STARTUP_FAILURE = 1;
constexpr int EXIT_USAGE = 2;

struct CommandLine {
  std::optional<fs::path> config;
  std::optional<uint16_t> port;
  std::optional<fs::path> frontend;
  std::optional<fs::path> helper;
  std::optional<std::string> run_as;
  bool no_run_as = false;
  std::string log_level;
  bool help = false;
  bool version = false;
};

void print_usage(std::ostream &out) {
  out << "Usage: clipshare-daemon [options]\n"
         "\n"
         "Options:\n"
         "  --config PATH      Settings file\n"
         "  --port N           Serve on port N instead of the saved port\n"
         "  --frontend DIR     Directory holding index.html and i18n.js\n"
         "  --helper PATH      Bundled xclip binary\n"
         "  --run-as USER      Run xclip as USER (default: deck)\n"
         "  --no-run-as        Run xclip as the current user\n"
         "  --log-level LEVEL  trace|debug|info|warn|error|critical|off\n"
         "  --version          Show the version\n"
         "  --help             Show this help\n";
}

/// Directory the daemon is installed in (parent of its bin/)
fs::path install_dir() {
  std::error_code ec;
  auto exe = fs::read_symlink("/proc/self/exe", ec);
  if (ec) {
    return fs::current_path(ec);
  }
  return exe.parent_path().parent_path();
}

bool parse_port(const std::string &text, uint16_t &port) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  try {
    unsigned long value = std::stoul(text);
    if (value > 65535) {
      return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

bool is_log_level(const std::string &name) {
  static const std::set<std::string> levels = {
      "trace", "debug", "info", "warn", "error", "critical", "off"};
  return levels.count(name) > 0;
}

/// @return false on a usage error (message already printed)
bool parse_args(int argc, char *argv[], CommandLine &cmd) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    bool has_value = false;

    auto eq = arg.find('=');
    if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
      value = arg.substr(eq + 1);
      arg.resize(eq);
      has_value = true;
    }

    auto take_value = [&]() -> bool {
      if (has_value) {
        return true;
      }
      if (i + 1 >= argc) {
        std::cerr << "clipshare-daemon: " << arg << " requires a value\n";
        return false;
      }
      value = argv[++i];
      return true;
    };

    if (arg == "--help" || arg == "-h") {
      cmd.help = true;
    } else if (arg == "--version") {
      cmd.version = true;
    } else if (arg == "--config") {
      if (!take_value()) {
        return false;
      }
      cmd.config = fs::path(value);
    } else if (arg == "--port") {
      if (!take_value()) {
        return false;
      }
      uint16_t port = 0;
      if (!parse_port(value, port)) {
        std::cerr << "clipshare-daemon: invalid port '" << value << "'\n";
        return false;
      }
      cmd.port = port;
    } else if (arg == "--frontend") {
      if (!take_value()) {
        return false;
      }
      cmd.frontend = fs::path(value);
    } else if (arg == "--helper") {
      if (!take_value()) {
        return false;
      }
      cmd.helper = fs::path(value);
    } else if (arg == "--run-as") {
      if (!take_value()) {
        return false;
      }
      cmd.run_as = value;
    } else if (arg == "--no-run-as") {
      cmd.no_run_as = true;
    } else if (arg == "--log-level") {
      if (!take_value()) {
        return false;
      }
      if (!is_log_level(value)) {
        std::cerr << "clipshare-daemon: unknown log level '" << value << "'\n";
        return false;
      }
      cmd.log_level = value;
    } else {
      std::cerr << "clipshare-daemon: unknown option '" << arg << "'\n";
      return false;
    }
  }

  if (cmd.no_run_as && cmd.run_as) {
    std::cerr << "clipshare-daemon: --run-as and --no-run-as conflict\n";
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  CommandLine cmd;
  if (!parse_args(argc, argv, cmd)) {
    print_usage(std::cerr);
    return EXIT_USAGE;
  }
  if (cmd.help) {
    print_usage(std::cout);
    return EXIT_OK;
  }
  if (cmd.version) {
    std::cout << "clipshare-daemon " << clipshare::get_version().version_string
              << "\n";
    return EXIT_OK;
  }

  clipshare::logging::init(cmd.log_level);

  fs::path base = install_dir();

  clipshare::ServiceOptions options;
  options.settings_path = cmd.config.value_or(fs::path());
  options.frontend_dir = cmd.frontend.value_or(base / "frontend");
  options.clipboard.bundled_helper =
      cmd.helper.value_or(base / "bin" / "xclip");
  if (cmd.no_run_as) {
    options.clipboard.run_as_user.clear();
  } else if (cmd.run_as) {
    options.clipboard.run_as_user = *cmd.run_as;
  }
  options.port_override = cmd.port;

  // Installed before the service starts its threads
  boost::asio::io_context signals_ioc;
  boost::asio::signal_set signals(signals_ioc, SIGINT, SIGTERM);

  clipshare::ClipShare service;

  auto init_result = service.init(options);
  if (init_result.is_error()) {
    CLIPSHARE_LOG_ERROR("Initialization failed: {}",
                        init_result.error().to_string());
    return EXIT_STARTUP_FAILURE;
  }

  auto start_result = service.start();
  if (start_result.is_error()) {
    CLIPSHARE_LOG_ERROR("Startup failed: {}", start_result.error().to_string());
    service.shutdown();
    return EXIT_STARTUP_FAILURE;
  }

  // Block until SIGINT/SIGTERM
  signals.async_wait(
      [](const boost::system::error_code &ec, int signal_number) {
        if (!ec) {
          CLIPSHARE_LOG_INFO("Received signal {}, shutting down",
                             signal_number);
        }
      });
  signals_ioc.run();

  service.shutdown();
  CLIPSHARE_LOG_INFO("clipshare stopped");
  return EXIT_OK;
}
