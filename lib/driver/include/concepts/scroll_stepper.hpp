#pragma once

#include <boost/asio/awaitable.hpp>
#include <concepts>
#include <core/direction.hpp>
#include <core/locator.hpp>
#include <core/scroll_step.hpp>
#include <string>

namespace scroll_driver::concepts {

/**
 * @brief Concept for types that perform session-scoped scroll steps.
 *
 * core::scroll_orchestrator satisfies it; scrollers build multi-step operations on top.
 */
template<typename T>
concept scroll_stepper =
  requires(T &stepper, const core::container_ref &container, core::physical_direction direction) {
    { stepper.begin_session() } -> std::same_as<void>;
    { stepper.end_session() } -> std::same_as<void>;
    { stepper.scroll(container, direction) } -> std::same_as<boost::asio::awaitable<core::scroll_step_result>>;
    { stepper.get_session_id() } -> std::convertible_to<std::string>;
  };

}// namespace scroll_driver::concepts
