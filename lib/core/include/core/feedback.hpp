#pragma once

#include <core/direction.hpp>
#include <cstdint>
#include <string>

namespace scroll_driver::core {

/// Marks a feedback field the platform did not populate
inline constexpr int unset_field = -1;

/**
 * @brief Best-effort position snapshot reported after a scroll.
 *
 * Every field is independently optional and carries unset_field when absent.
 * The index triad is only usable when all three of its fields are set; the
 * offsets of an axis are only usable when both the offset and its maximum are set.
 */
struct feedback_signal
{
  int from_index = unset_field;///< First visible item index
  int to_index = unset_field;///< Last visible item index
  int item_count = unset_field;///< Total number of items in the container
  int scroll_x = unset_field;///< Horizontal scroll offset in pixels
  int scroll_y = unset_field;///< Vertical scroll offset in pixels
  int max_scroll_x = unset_field;///< Largest horizontal scroll offset
  int max_scroll_y = unset_field;///< Largest vertical scroll offset

  [[nodiscard]] auto has_index_range() const -> bool
  {
    return from_index != unset_field and to_index != unset_field and item_count != unset_field;
  }

  [[nodiscard]] auto has_offsets(scroll_axis axis) const -> bool
  {
    if (axis == scroll_axis::vertical) { return scroll_y != unset_field and max_scroll_y != unset_field; }
    return scroll_x != unset_field and max_scroll_x != unset_field;
  }

  [[nodiscard]] auto offset(scroll_axis axis) const -> int
  {
    return axis == scroll_axis::vertical ? scroll_y : scroll_x;
  }

  [[nodiscard]] auto max_offset(scroll_axis axis) const -> int
  {
    return axis == scroll_axis::vertical ? max_scroll_y : max_scroll_x;
  }

  /// True when no field at all was populated
  [[nodiscard]] auto is_empty() const -> bool
  {
    return from_index == unset_field and to_index == unset_field and item_count == unset_field
           and scroll_x == unset_field and scroll_y == unset_field and max_scroll_x == unset_field
           and max_scroll_y == unset_field;
  }

  auto operator==(const feedback_signal &) const -> bool = default;
};

/// Platform event type bits, matching the accessibility event type values
namespace event_type {
  inline constexpr std::uint32_t view_clicked = 0x00000001;
  inline constexpr std::uint32_t view_focused = 0x00000008;
  inline constexpr std::uint32_t window_content_changed = 0x00000800;
  inline constexpr std::uint32_t view_scrolled = 0x00001000;
}// namespace event_type

/// One event observed on the platform event stream
struct feedback_event
{
  std::uint32_t types = 0;///< Bitmask of event_type values
  feedback_signal signal;///< Position data carried by the event
  std::string source;///< Description of the view that emitted the event

  [[nodiscard]] auto is_scroll() const -> bool { return (types & event_type::view_scrolled) != 0; }
};

/// Platform notification that no further events will follow the current gesture
struct capture_complete
{
};

/**
 * @brief Renders the populated fields of a signal for logging.
 *
 * @param signal Signal to describe
 * @return e.g. "{from_index=0, to_index=9, item_count=40}" or "{}" when empty
 */
[[nodiscard]] auto describe(const feedback_signal &signal) -> std::string;

}// namespace scroll_driver::core
