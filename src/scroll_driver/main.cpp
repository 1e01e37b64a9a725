#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <capture/feedback_queue.hpp>
#include <capture/last_event_capture.hpp>
#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <core/end_detector.hpp>
#include <core/errors.hpp>
#include <core/locator.hpp>
#include <core/scroll_orchestrator.hpp>
#include <driver/errors.hpp>
#include <driver/image.hpp>
#include <driver/main_thread.hpp>
#include <driver/report.hpp>
#include <driver/root_finder.hpp>
#include <driver/screenshot.hpp>
#include <driver/scroller.hpp>
#include <exception>
#include <fmt/core.h>
#include <memory>
#include <sim/device.hpp>
#include <sim/window.hpp>
#include <spdlog/spdlog.h>

#include "internal_use_only/config.hpp"

namespace {

constexpr int screen_width = 1080;
constexpr int screen_height = 1920;
constexpr int status_bar_height = 63;
constexpr scroll_driver::driver::pixel_t app_background = 0xFFFAFAFA;

auto run(const scroll_driver::cli_utils::cli_args &args) -> int
{
  using namespace scroll_driver;
  using capture_t = capture::last_event_capture<sim::device>;
  using orchestrator_t = core::scroll_orchestrator<capture_t, core::configurable_end_detector>;

  const auto settings = cli_utils::make_run_settings(args);
  cli_utils::print_app_banner(settings);

  auto io_context = std::make_shared<boost::asio::io_context>();
  auto feedback = std::make_shared<capture::feedback_queue>(io_context);
  auto device =
    std::make_shared<sim::device>(feedback, sim::device_config{ .signal_completion = not args.wait_full_timeout });

  auto &list = device->add_scrollable(settings.view);
  device->launch(sim::activity{ .name = "ListActivity",
    .decor_view = sim::window{ .title = "ListActivity",
      .focused = true,
      .location = { 0, status_bar_height },
      .width = screen_width,
      .height = screen_height - status_bar_height,
      .color = app_background } });

  driver::root_finder<sim::device> finder(device, settings.foreground_timeout);
  const auto root = finder.find_root_view();
  spdlog::debug("Root view: {}", root.title);

  auto capture = std::make_shared<capture_t>(device, feedback, settings.scroll_event_timeout);
  auto orchestrator =
    std::make_shared<orchestrator_t>(capture, core::configurable_end_detector(settings.strategy));
  driver::scroller<orchestrator_t> scroller(orchestrator, args.max_scrolls);

  const auto container = core::make_locator(settings.view.name);
  const int target = args.find_index;
  auto found = [&list, target]() { return target >= 0 and list.is_visible(target); };

  auto pending = boost::asio::co_spawn(
    *io_context, scroller.scroll_until(container, settings.direction, found), boost::asio::use_future);
  io_context->run();
  const auto summary = pending.get();

  cli_utils::print_summary(summary);

  if (not args.report_path.empty()) {
    driver::write_report(summary, args.report_path);
    fmt::print("report written to {}\n", args.report_path);
  }

  if (not args.screenshot_path.empty()) {
    driver::main_thread ui_thread;
    if (auto screenshot = driver::take_screenshot(ui_thread, root)) {
      driver::write_png(*screenshot, args.screenshot_path);
      fmt::print("screenshot written to {}\n", args.screenshot_path);
    } else {
      spdlog::warn("No screenshot taken");
    }
  }

  return target >= 0 and not summary.found ? 2 : 0;
}

}// namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int
{
  auto args = scroll_driver::cli_utils::parse_cli_args(argc, argv);

  if (args.show_version) {
    fmt::print("{} v{}\n", scroll_driver::cmake::project_name, scroll_driver::cmake::project_version);
    return 0;
  }

  scroll_driver::cli_utils::configure_logging(args);

  if (not scroll_driver::cli_utils::validate_cli_args(args)) { return 1; }

  try {
    return run(args);
  } catch (const scroll_driver::core::unrecoverable_error &err) {
    spdlog::error("Unrecoverable: {}", err.what());
  } catch (const scroll_driver::driver::timeout_error &err) {
    spdlog::error("{}", err.what());
  } catch (const std::exception &err) {
    spdlog::error("Unexpected error: {}", err.what());
  }
  return 1;
}
