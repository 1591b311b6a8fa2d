/// @file
/// @brief Replays a scripted note-event stream through a practice session.

#include <signal.h>

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "json_bridge.hpp"
#include "keys/session_engine.hpp"
#include "replay.hpp"

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void handle_interrupt(int /*signal*/) {
  g_interrupted = 1;
}

struct CliOptions {
  std::string config_path;
  std::string events_path;  // empty = stdin
  bool text = false;
  bool help = false;
};

void printUsage() {
  std::printf("keys_replay - keyboard practice session replay\n\n");
  std::printf("Usage: keys_replay --config FILE [--events FILE] [--text]\n\n");
  std::printf("Options:\n");
  std::printf("  --config FILE    Practice configuration (JSON)\n");
  std::printf("  --events FILE    Note events, one JSON object per line (default: stdin;\n");
  std::printf("                   use stdin for live input so Ctrl+C ends the session)\n");
  std::printf("  --text           Human-readable output instead of JSON lines\n");
  std::printf("  --help           Show this help\n");
  std::printf("\nEvent lines:\n");
  std::printf("  {\"t\": 1200, \"kind\": \"on\", \"pitch\": 60, \"velocity\": 90}\n");
  std::printf("  {\"t\": 1500, \"kind\": \"off\", \"pitch\": 60}\n");
  std::printf("  {\"t\": 9000, \"kind\": \"tick\"}   advances the clock only\n");
}

/// @return False if --help was requested or the arguments are unusable.
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
  for (int idx = 1; idx < argc; ++idx) {
    if (std::strcmp(argv[idx], "--help") == 0 || std::strcmp(argv[idx], "-h") == 0) {
      printUsage();
      opts.help = true;
      return false;
    }
    if (std::strcmp(argv[idx], "--config") == 0 && idx + 1 < argc) {
      opts.config_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--events") == 0 && idx + 1 < argc) {
      opts.events_path = argv[++idx];
    } else if (std::strcmp(argv[idx], "--text") == 0) {
      opts.text = true;
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", argv[idx]);
      printUsage();
      return false;
    }
  }
  if (opts.config_path.empty()) {
    std::fprintf(stderr, "--config is required\n");
    return false;
  }
  return true;
}

nlohmann::json read_json_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open configuration: " + path);
  }
  return nlohmann::json::parse(in);
}

// No SA_RESTART: a read blocked on stdin fails with EINTR instead of
// resuming, so the replay loop sees the interrupt straight away.
void install_interrupt_handler() {
  struct sigaction action {};
  action.sa_handler = handle_interrupt;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  if (sigaction(SIGINT, &action, nullptr) != 0) {
    throw std::runtime_error(std::string("sigaction failed: ") + std::strerror(errno));
  }
}

int run(const CliOptions& opts) {
  const auto config = keys::bridge::practice_config_from_json(read_json_file(opts.config_path));
  keys::SessionStats stats;
  auto engine = keys::make_engine(config, stats);

  std::ifstream file;
  if (!opts.events_path.empty()) {
    file.open(opts.events_path);
    if (!file) {
      throw std::runtime_error("Failed to open events: " + opts.events_path);
    }
  }
  std::istream& events = opts.events_path.empty() ? std::cin : file;

  keys::ReplayOptions replay_options;
  replay_options.text = opts.text;
  replay_options.coincidence_window_ms = config.coincidence_window_ms;
  const auto report = keys::replay(events, *engine, replay_options, std::cout,
                                   [] { return g_interrupted != 0; });
  if (report.interrupted) {
    std::cerr << "keys_replay: interrupted, in-flight round discarded" << std::endl;
  }
  return 0;
}

} // namespace

int main(int argc, char* argv[]) {
  CliOptions opts;
  if (!parseArgs(argc, argv, opts)) {
    return opts.help ? 0 : 1;
  }
  try {
    install_interrupt_handler();
    return run(opts);
  } catch (const std::exception& ex) {
    std::cerr << "keys_replay: " << ex.what() << std::endl;
    return 1;
  }
}
