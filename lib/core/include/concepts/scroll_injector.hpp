#pragma once

#include <concepts>
#include <core/direction.hpp>
#include <core/locator.hpp>

namespace scroll_driver::concepts {

/**
 * @brief Concept for the platform binding that injects one scroll gesture.
 *
 * perform_scroll() may throw core::unrecoverable_error when the injection mechanism
 * cannot be engaged.
 */
template<typename T>
concept scroll_injector =
  requires(T &injector, const core::container_ref &container, core::physical_direction direction) {
    { injector.perform_scroll(container, direction) } -> std::same_as<void>;
  };

}// namespace scroll_driver::concepts
