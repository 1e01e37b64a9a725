#pragma once

#include <concepts/root_view.hpp>
#include <driver/image.hpp>
#include <driver/main_thread.hpp>
#include <exception>
#include <optional>
#include <spdlog/spdlog.h>

namespace scroll_driver::driver {

/**
 * @brief Places a view's drawing cache where the view sits on screen.
 *
 * A view at the screen origin yields its cache unchanged. Otherwise the cache is drawn
 * at its screen position on a transparent canvas covering the origin as well.
 */
[[nodiscard]] auto compose_at_location(const image &drawing_cache, point location) -> image;

/**
 * @brief Captures a root view on the main thread.
 *
 * @tparam View Type satisfying the root_view concept
 * @param ui_thread Main thread the view belongs to
 * @param root Root view to capture
 * @return The screenshot, or std::nullopt when capturing failed (the failure is logged)
 */
template<concepts::root_view View>
[[nodiscard]] auto take_screenshot(main_thread &ui_thread, const View &root) -> std::optional<image>
{
  return ui_thread.run_on_main_sync([&root]() -> std::optional<image> {
    try {
      return compose_at_location(root.render(), root.location_on_screen());
    } catch (const std::exception &err) {
      spdlog::error("[screenshot] Capture failed: {}", err.what());
      return std::nullopt;
    }
  });
}

}// namespace scroll_driver::driver
