#pragma once

#include <concepts/end_detector.hpp>
#include <core/direction.hpp>
#include <core/feedback.hpp>
#include <optional>
#include <string_view>
#include <variant>

namespace scroll_driver::core {

/**
 * @brief Detects the end of scrolling from the index and offset data of a signal.
 *
 * Evaluated in precedence order:
 * 1. no signal at all counts as the end;
 * 2. a complete index triad is at the end when the first or last item is visible;
 * 3. complete offsets for the axis are at the end when the offset is 0 or the maximum;
 * 4. otherwise the signal is at the end only if it carries no data whatsoever.
 */
struct index_offset_end_detector
{
  [[nodiscard]] auto detect_end(const std::optional<feedback_signal> &signal, scroll_axis axis) const -> bool;
};

/**
 * @brief Treats only the absence of a signal as the end.
 *
 * Some containers emit unreliable index or offset data. Waiting for silence costs one
 * extra gesture but never stops early.
 */
struct silence_end_detector
{
  [[nodiscard]] auto detect_end(const std::optional<feedback_signal> &signal, scroll_axis /*axis*/) const -> bool
  {
    return not signal.has_value();
  }
};

static_assert(concepts::end_detector<index_offset_end_detector>);
static_assert(concepts::end_detector<silence_end_detector>);

enum class detection_strategy {
  index_offset,
  silence,
};

[[nodiscard]] auto to_string(detection_strategy strategy) -> std::string_view;

/**
 * @brief Parses "index-offset" or "silence".
 *
 * @param name Strategy name as given on the command line
 * @return Parsed strategy, std::nullopt if the name is unknown
 */
[[nodiscard]] auto parse_detection_strategy(std::string_view name) -> std::optional<detection_strategy>;

inline auto format_as(detection_strategy strategy) -> std::string_view { return to_string(strategy); }

/**
 * @brief End detector whose strategy is chosen at construction time.
 */
class configurable_end_detector
{
public:
  explicit configurable_end_detector(detection_strategy strategy);

  [[nodiscard]] auto detect_end(const std::optional<feedback_signal> &signal, scroll_axis axis) const -> bool;

  [[nodiscard]] auto strategy() const -> detection_strategy { return strategy_; }

private:
  detection_strategy strategy_;
  std::variant<index_offset_end_detector, silence_end_detector> detector_;
};

static_assert(concepts::end_detector<configurable_end_detector>);

}// namespace scroll_driver::core
