#pragma once

#include <CLI/CLI.hpp>
#include <core/direction.hpp>
#include <core/end_detector.hpp>
#include <cstdlib>
#include <filesystem>
#include <sim/scrollable_view.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace scroll_driver::cli_utils {

struct cli_args
{
  std::string direction = "down";
  std::string strategy = "index-offset";
  std::string event_mode = "indexed";
  int timeout_ms = 1000;
  int items = 40;
  int visible = 10;
  int start = 0;
  int max_scrolls = 100;
  int find_index = -1;
  int foreground_timeout_ms = 5000;
  bool wait_full_timeout = false;
  std::string screenshot_path;
  std::string report_path;
  bool verbose = false;
  bool show_version = false;
};

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void;

/**
 * @brief Resolves a leading "~" in an output path against a home directory.
 *
 * @param path Output path as given on the command line or in a config file
 * @param home Home directory; when empty the path is returned unchanged
 * @return The path with "~" or "~/..." rebased onto home; "~user" forms are left alone
 */
[[nodiscard]] inline auto expand_home_path(const std::string &path, const std::string &home) -> std::string
{
  if (home.empty()) { return path; }
  if (path == "~") { return home; }
  if (not path.starts_with("~/")) { return path; }

  return (std::filesystem::path(home) / path.substr(2)).string();
}

inline auto expand_home_path(const std::string &path) -> std::string
{
  const char *home = std::getenv("HOME");// NOLINT(concurrency-mt-unsafe)
  return expand_home_path(path, home != nullptr ? std::string(home) : std::string{});
}

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "Scroll Driver - drives a scrollable container until it stops moving", "scroll-driver" };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    std::exit(app.exit(e));// NOLINT(concurrency-mt-unsafe)
  }

  if (not args.screenshot_path.empty()) { args.screenshot_path = expand_home_path(args.screenshot_path); }
  if (not args.report_path.empty()) { args.report_path = expand_home_path(args.report_path); }

  return args;
}

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.set_config("--config", "", "Read options from an INI or TOML file");

  app.add_option("-d,--direction", args.direction, "Gesture direction: up, down, left, right")
    ->check(CLI::IsMember({ "up", "down", "left", "right" }));
  app.add_option("-s,--strategy", args.strategy, "End detection: index-offset, silence")
    ->check(CLI::IsMember({ "index-offset", "silence" }));
  app.add_option("-t,--timeout-ms", args.timeout_ms, "How long to collect scroll events after each gesture")
    ->check(CLI::NonNegativeNumber);
  app.add_option("--event-mode", args.event_mode, "Events the container emits: indexed, offsets, silent, unrelated, empty")
    ->check(CLI::IsMember({ "indexed", "offsets", "silent", "unrelated", "empty" }));
  app.add_option("--items", args.items, "Number of items in the container")->check(CLI::NonNegativeNumber);
  app.add_option("--visible", args.visible, "Items visible at once")->check(CLI::PositiveNumber);
  app.add_option("--start", args.start, "First visible item before scrolling")->check(CLI::NonNegativeNumber);
  app.add_option("--max-scrolls", args.max_scrolls, "Give up after this many steps")->check(CLI::PositiveNumber);
  app.add_option("--find", args.find_index, "Stop once this item index is visible");
  app.add_option("--foreground-timeout-ms", args.foreground_timeout_ms, "How long to wait for the foreground window")
    ->check(CLI::NonNegativeNumber);
  app.add_flag("--wait-full-timeout", args.wait_full_timeout, "Do not report completion after each gesture");
  app.add_option("--screenshot", args.screenshot_path, "Write a PNG screenshot of the root view");
  app.add_option("--report", args.report_path, "Write a JSON report of the scroll session");
  app.add_flag("-v,--verbose", args.verbose, "Enable verbose logging");
  app.add_flag("--version", args.show_version, "Show version information");
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  if (not core::parse_physical_direction(args.direction)) {
    spdlog::error("Invalid direction: {}", args.direction);
    return false;
  }

  if (not core::parse_detection_strategy(args.strategy)) {
    spdlog::error("Invalid strategy: {}", args.strategy);
    return false;
  }

  if (not sim::parse_event_mode(args.event_mode)) {
    spdlog::error("Invalid event mode: {}", args.event_mode);
    return false;
  }

  if (args.visible < 1) {
    spdlog::error("At least one item must be visible");
    return false;
  }

  if (not sim::pixel_extent_fits(args.items, sim::view_config{}.pixels_per_item)) {
    spdlog::error("{} items are more than the simulated container can scroll through", args.items);
    return false;
  }

  if (args.find_index >= args.items) {
    spdlog::error("Item {} does not exist, the container holds {} items", args.find_index, args.items);
    return false;
  }

  return true;
}

}// namespace scroll_driver::cli_utils
