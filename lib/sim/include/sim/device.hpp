#pragma once

#include <capture/feedback_queue.hpp>
#include <concepts/root_view.hpp>
#include <concepts/scroll_injector.hpp>
#include <core/direction.hpp>
#include <core/locator.hpp>
#include <map>
#include <memory>
#include <optional>
#include <sim/scrollable_view.hpp>
#include <sim/window.hpp>
#include <string>
#include <vector>

namespace scroll_driver::sim {

struct device_config
{
  bool signal_completion = true;///< Report completion after the events of each gesture
  int polls_until_foreground = 0;///< Foreground polls answered with "no activity" first
};

/**
 * @brief In-process stand-in for the device under test.
 *
 * Injects gestures into simulated views, feeds the resulting events to the feedback
 * queue, and answers the window queries of the root finder.
 */
class device
{
public:
  using view_t = window;

  explicit device(std::shared_ptr<capture::feedback_queue> feedback, device_config config = {});

  /**
   * @brief Adds a scrollable container, found by locators with the view's name as description.
   *
   * @throws std::invalid_argument when the name is taken or the configuration is invalid
   */
  auto add_scrollable(view_config config) -> scrollable_view &;

  [[nodiscard]] auto find_scrollable(const std::string &name) -> scrollable_view *;

  /**
   * @brief Performs one gesture on the container the locator describes.
   *
   * @throws core::unrecoverable_error when disconnected or the container does not exist
   */
  auto perform_scroll(const core::container_ref &container, core::physical_direction direction) -> void;

  /// Makes every later gesture fail as if the injection service went away
  auto disconnect() -> void { connected_ = false; }

  [[nodiscard]] auto get_gesture_count() const -> int { return gesture_count_; }

  auto launch(activity foreground) -> void;
  auto add_window(window overlay) -> void;

  [[nodiscard]] auto foreground_decor_view() -> std::optional<window>;
  [[nodiscard]] auto root_views() -> std::vector<window>;
  [[nodiscard]] auto get_foreground_polls() const -> int { return foreground_polls_; }

private:
  std::shared_ptr<capture::feedback_queue> feedback_;
  device_config config_;
  std::map<std::string, scrollable_view, std::less<>> views_;
  std::optional<activity> foreground_;
  std::vector<window> overlays_;
  bool connected_ = true;
  int gesture_count_ = 0;
  int foreground_polls_ = 0;
};

static_assert(concepts::scroll_injector<device>);
static_assert(concepts::window_source<device>);

}// namespace scroll_driver::sim
