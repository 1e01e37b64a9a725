#pragma once

#include <core/feedback.hpp>
#include <optional>
#include <string_view>

namespace scroll_driver::core {

enum class scroll_outcome {
  continued,///< A gesture ran and more scrolling may be possible
  end_reached,///< A gesture ran and it was the last one possible
  no_movement,///< The end was already confirmed; no gesture was issued
};

[[nodiscard]] constexpr auto to_string(scroll_outcome outcome) -> std::string_view
{
  switch (outcome) {
  case scroll_outcome::continued:
    return "continued";
  case scroll_outcome::end_reached:
    return "end_reached";
  case scroll_outcome::no_movement:
    return "no_movement";
  }
  return "unknown";
}

inline auto format_as(scroll_outcome outcome) -> std::string_view { return to_string(outcome); }

/// Result of one scroll step
struct scroll_step_result
{
  scroll_outcome outcome = scroll_outcome::continued;
  bool gesture_performed = false;
  std::optional<feedback_signal> signal;///< Feedback the step was classified on

  [[nodiscard]] auto can_continue() const -> bool { return outcome == scroll_outcome::continued; }
};

}// namespace scroll_driver::core
