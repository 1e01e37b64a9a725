#pragma once

#include <boost/asio/awaitable.hpp>
#include <concepts>
#include <core/direction.hpp>
#include <core/feedback.hpp>
#include <core/locator.hpp>
#include <optional>

namespace scroll_driver::concepts {

/**
 * @brief Concept defining the interface for performing a scroll and capturing its feedback.
 *
 * capture() issues exactly one gesture on the container and yields the last relevant
 * feedback signal observed within a bounded time window, or std::nullopt when none
 * arrived. The gesture takes effect whatever the result.
 */
template<typename T>
concept event_capture =
  requires(T &capture, const core::container_ref &container, core::physical_direction direction) {
    {
      capture.capture(container, direction)
    } -> std::same_as<boost::asio::awaitable<std::optional<core::feedback_signal>>>;
  };

}// namespace scroll_driver::concepts
