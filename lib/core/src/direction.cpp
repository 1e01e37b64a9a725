#include <core/direction.hpp>

namespace scroll_driver::core {

auto standard_direction_converter::axis_of(physical_direction direction) -> scroll_axis
{
  switch (direction) {
  case physical_direction::up:
  case physical_direction::down:
    return scroll_axis::vertical;
  case physical_direction::left:
  case physical_direction::right:
    return scroll_axis::horizontal;
  }
  return scroll_axis::vertical;
}

auto standard_direction_converter::to_physical(scroll_axis axis, logical_direction direction) -> physical_direction
{
  if (axis == scroll_axis::vertical) {
    return direction == logical_direction::forward ? physical_direction::down : physical_direction::up;
  }
  return direction == logical_direction::forward ? physical_direction::right : physical_direction::left;
}

auto to_string(scroll_axis axis) -> std::string_view
{
  switch (axis) {
  case scroll_axis::horizontal:
    return "horizontal";
  case scroll_axis::vertical:
    return "vertical";
  }
  return "unknown";
}

auto to_string(physical_direction direction) -> std::string_view
{
  switch (direction) {
  case physical_direction::up:
    return "up";
  case physical_direction::down:
    return "down";
  case physical_direction::left:
    return "left";
  case physical_direction::right:
    return "right";
  }
  return "unknown";
}

auto to_string(logical_direction direction) -> std::string_view
{
  return direction == logical_direction::forward ? "forward" : "backward";
}

auto parse_physical_direction(std::string_view name) -> std::optional<physical_direction>
{
  if (name == "up") { return physical_direction::up; }
  if (name == "down") { return physical_direction::down; }
  if (name == "left") { return physical_direction::left; }
  if (name == "right") { return physical_direction::right; }
  return std::nullopt;
}

}// namespace scroll_driver::core
