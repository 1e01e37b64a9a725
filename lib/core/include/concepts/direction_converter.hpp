#pragma once

#include <concepts>
#include <core/direction.hpp>

namespace scroll_driver::concepts {

/**
 * @brief Concept for stateless direction lookups.
 */
template<typename T>
concept direction_converter = requires(const T &converter,
  core::physical_direction direction,
  core::scroll_axis axis,
  core::logical_direction logical) {
  { converter.axis_of(direction) } -> std::same_as<core::scroll_axis>;
  { converter.to_physical(axis, logical) } -> std::same_as<core::physical_direction>;
};

}// namespace scroll_driver::concepts
