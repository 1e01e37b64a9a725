#pragma once

#include <optional>
#include <string_view>

namespace scroll_driver::core {

/// Axis a scrollable container moves along
enum class scroll_axis {
  horizontal,
  vertical,
};

/// Direction of a scroll gesture on screen
enum class physical_direction {
  up,
  down,
  left,
  right,
};

/// Direction relative to the content order of a container
enum class logical_direction {
  forward,
  backward,
};

/**
 * @brief Stateless mapping between directions and axes.
 *
 * Forward content is reached by scrolling down on the vertical axis and right on the
 * horizontal axis.
 */
struct standard_direction_converter
{
  [[nodiscard]] static auto axis_of(physical_direction direction) -> scroll_axis;

  [[nodiscard]] static auto to_physical(scroll_axis axis, logical_direction direction) -> physical_direction;
};

[[nodiscard]] auto to_string(scroll_axis axis) -> std::string_view;
[[nodiscard]] auto to_string(physical_direction direction) -> std::string_view;
[[nodiscard]] auto to_string(logical_direction direction) -> std::string_view;

/**
 * @brief Parses a lower-case direction name ("up", "down", "left", "right").
 *
 * @param name Direction name
 * @return Parsed direction, std::nullopt if the name is unknown
 */
[[nodiscard]] auto parse_physical_direction(std::string_view name) -> std::optional<physical_direction>;

inline auto format_as(scroll_axis axis) -> std::string_view { return to_string(axis); }
inline auto format_as(physical_direction direction) -> std::string_view { return to_string(direction); }
inline auto format_as(logical_direction direction) -> std::string_view { return to_string(direction); }

}// namespace scroll_driver::core
