#pragma once

#include <concepts>
#include <core/direction.hpp>
#include <core/feedback.hpp>
#include <optional>

namespace scroll_driver::concepts {

/**
 * @brief Concept defining the interface for deciding whether a scroll hit the boundary.
 *
 * Types satisfying this concept map the feedback captured after one gesture (or its
 * absence) and the axis of that gesture to an "end reached" verdict.
 */
template<typename T>
concept end_detector = requires(const T &detector,
  const std::optional<core::feedback_signal> &signal,
  core::scroll_axis axis) {
  { detector.detect_end(signal, axis) } -> std::same_as<bool>;
};

}// namespace scroll_driver::concepts
