#pragma once

#include <core/direction.hpp>
#include <core/feedback.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scroll_driver::sim {

/// Which data a simulated container puts into its scroll events
enum class event_mode {
  indexed,///< Index triad, like an adapter-backed list
  offsets,///< Pixel offsets for the scroll axis
  silent,///< No events at all
  unrelated,///< Only the offsets of the other axis
  empty,///< Scroll events without any data
};

[[nodiscard]] auto to_string(event_mode mode) -> std::string_view;
[[nodiscard]] auto parse_event_mode(std::string_view name) -> std::optional<event_mode>;

inline auto format_as(event_mode mode) -> std::string_view { return to_string(mode); }

/// True when every pixel offset of such a container fits an int
[[nodiscard]] auto pixel_extent_fits(int item_count, int pixels_per_item) -> bool;

struct view_config
{
  std::string name;
  int item_count = 0;
  int visible_items = 1;
  int first_visible = 0;
  int pixels_per_item = 48;
  core::scroll_axis axis = core::scroll_axis::vertical;
  event_mode mode = event_mode::indexed;
};

/**
 * @brief A list of items scrolled one page per gesture.
 *
 * A gesture along the view's own axis moves it by a page (one item of overlap) and stops
 * at either boundary. Gestures across the axis, or toward a boundary already reached, do
 * not move the view and emit nothing.
 */
class scrollable_view
{
public:
  /**
   * @throws std::invalid_argument for negative counts, no visible items, or content too
   *         tall for int pixel offsets
   */
  explicit scrollable_view(view_config config);

  /**
   * @brief Applies one gesture.
   *
   * @param direction Direction of the gesture
   * @return The events the view emits, in order
   */
  auto scroll(core::physical_direction direction) -> std::vector<core::feedback_event>;

  [[nodiscard]] auto first_visible() const -> int { return config_.first_visible; }
  [[nodiscard]] auto last_visible() const -> int;
  [[nodiscard]] auto max_first_visible() const -> int;
  [[nodiscard]] auto is_visible(int index) const -> bool;
  [[nodiscard]] auto at_start() const -> bool { return config_.first_visible == 0; }
  [[nodiscard]] auto at_end() const -> bool { return config_.first_visible == max_first_visible(); }
  [[nodiscard]] auto get_config() const -> const view_config & { return config_; }

  /// Full position data of the current state
  [[nodiscard]] auto snapshot() const -> core::feedback_signal;

private:
  [[nodiscard]] auto make_event(const core::feedback_signal &position) const -> core::feedback_event;

  view_config config_;
};

}// namespace scroll_driver::sim
