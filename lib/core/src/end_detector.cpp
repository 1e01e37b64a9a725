#include <core/end_detector.hpp>

#include <cstdint>

namespace scroll_driver::core {

auto index_offset_end_detector::detect_end(const std::optional<feedback_signal> &signal, scroll_axis axis) const
  -> bool
{
  if (not signal.has_value()) { return true; }

  // Adapter views report indices we can use to find either boundary.
  // Platform values are arbitrary, so the last index is computed wider than int.
  if (signal->has_index_range()) {
    return signal->from_index == 0
           or static_cast<std::int64_t>(signal->to_index) == static_cast<std::int64_t>(signal->item_count) - 1;
  }

  if (signal->has_offsets(axis)) {
    const auto offset = signal->offset(axis);
    return offset == 0 or offset == signal->max_offset(axis);
  }

  // A present signal with unrelated data is not an end; a completely empty one is.
  return signal->is_empty();
}

auto to_string(detection_strategy strategy) -> std::string_view
{
  switch (strategy) {
  case detection_strategy::index_offset:
    return "index-offset";
  case detection_strategy::silence:
    return "silence";
  }
  return "unknown";
}

auto parse_detection_strategy(std::string_view name) -> std::optional<detection_strategy>
{
  if (name == "index-offset") { return detection_strategy::index_offset; }
  if (name == "silence") { return detection_strategy::silence; }
  return std::nullopt;
}

namespace {

  auto make_detector(detection_strategy strategy) -> std::variant<index_offset_end_detector, silence_end_detector>
  {
    if (strategy == detection_strategy::silence) { return silence_end_detector{}; }
    return index_offset_end_detector{};
  }

}// namespace

configurable_end_detector::configurable_end_detector(detection_strategy strategy)
  : strategy_(strategy), detector_(make_detector(strategy))
{}

auto configurable_end_detector::detect_end(const std::optional<feedback_signal> &signal, scroll_axis axis) const
  -> bool
{
  return std::visit([&signal, axis](const auto &detector) { return detector.detect_end(signal, axis); }, detector_);
}

}// namespace scroll_driver::core
