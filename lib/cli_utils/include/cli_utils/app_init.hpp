#pragma once

#include <chrono>
#include <cli_utils/cli_parser.hpp>
#include <core/direction.hpp>
#include <core/end_detector.hpp>
#include <core/scroll_step.hpp>
#include <driver/scroller.hpp>
#include <fmt/core.h>
#include <sim/scrollable_view.hpp>
#include <spdlog/spdlog.h>
#include <string>

#include "internal_use_only/config.hpp"

namespace scroll_driver::cli_utils {

/// Settings derived from validated arguments
struct run_settings
{
  core::physical_direction direction;
  core::detection_strategy strategy;
  sim::view_config view;
  std::chrono::milliseconds scroll_event_timeout;
  std::chrono::milliseconds foreground_timeout;
};

inline auto configure_logging(const cli_args &args) -> void
{
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  if (args.verbose) { spdlog::set_level(spdlog::level::debug); }
}

/// Expects arguments that passed validate_cli_args()
[[nodiscard]] inline auto make_run_settings(const cli_args &args) -> run_settings
{
  const auto direction = core::parse_physical_direction(args.direction).value_or(core::physical_direction::down);

  return run_settings{
    .direction = direction,
    .strategy = core::parse_detection_strategy(args.strategy).value_or(core::detection_strategy::index_offset),
    .view = sim::view_config{ .name = "list",
      .item_count = args.items,
      .visible_items = args.visible,
      .first_visible = args.start,
      .axis = core::standard_direction_converter::axis_of(direction),
      .mode = sim::parse_event_mode(args.event_mode).value_or(sim::event_mode::indexed) },
    .scroll_event_timeout = std::chrono::milliseconds(args.timeout_ms),
    .foreground_timeout = std::chrono::milliseconds(args.foreground_timeout_ms),
  };
}

inline auto print_app_banner(const run_settings &settings) -> void
{
  fmt::print("Scroll Driver v{}\n", scroll_driver::cmake::project_version);
  fmt::print("container: {} ({} items, {} visible, {} events)\n",
    settings.view.name,
    settings.view.item_count,
    settings.view.visible_items,
    settings.view.mode);
  fmt::print("direction: {}  strategy: {}  event timeout: {}ms\n\n",
    settings.direction,
    settings.strategy,
    settings.scroll_event_timeout.count());
}

inline auto print_summary(const driver::scroll_summary &summary) -> void
{
  int index = 0;
  for (const auto &step : summary.trail) {
    fmt::print("step {:>3}: {:<12} signal={}\n",
      ++index,
      step.outcome,
      step.signal.has_value() ? core::describe(*step.signal) : std::string("none"));
  }

  fmt::print("\nsession {}: {} steps, {} gestures", summary.session_id, summary.steps, summary.gestures);
  if (summary.found) { fmt::print(", target found"); }
  if (summary.reached_end) { fmt::print(", end reached"); }
  if (summary.gave_up) { fmt::print(", gave up"); }
  fmt::print("\n");
}

}// namespace scroll_driver::cli_utils
