#include <sim/scrollable_view.hpp>

#include <algorithm>
#include <core/direction.hpp>
#include <cstdint>
#include <cstdlib>
#include <fmt/format.h>
#include <limits>
#include <stdexcept>
#include <utility>

namespace scroll_driver::sim {

auto to_string(event_mode mode) -> std::string_view
{
  switch (mode) {
  case event_mode::indexed:
    return "indexed";
  case event_mode::offsets:
    return "offsets";
  case event_mode::silent:
    return "silent";
  case event_mode::unrelated:
    return "unrelated";
  case event_mode::empty:
    return "empty";
  }
  return "unknown";
}

auto parse_event_mode(std::string_view name) -> std::optional<event_mode>
{
  for (auto mode :
    { event_mode::indexed, event_mode::offsets, event_mode::silent, event_mode::unrelated, event_mode::empty }) {
    if (to_string(mode) == name) { return mode; }
  }
  return std::nullopt;
}

auto pixel_extent_fits(int item_count, int pixels_per_item) -> bool
{
  return static_cast<std::int64_t>(item_count) * pixels_per_item <= std::numeric_limits<int>::max();
}

scrollable_view::scrollable_view(view_config config) : config_(std::move(config))
{
  if (config_.item_count < 0) { throw std::invalid_argument(fmt::format("{}: negative item count", config_.name)); }
  if (config_.visible_items < 1) { throw std::invalid_argument(fmt::format("{}: no visible items", config_.name)); }
  if (config_.pixels_per_item < 1) { throw std::invalid_argument(fmt::format("{}: empty items", config_.name)); }
  if (not pixel_extent_fits(config_.item_count, config_.pixels_per_item)) {
    throw std::invalid_argument(fmt::format(
      "{}: {} items of {}px exceed the scroll offset range", config_.name, config_.item_count, config_.pixels_per_item));
  }
  config_.first_visible = std::clamp(config_.first_visible, 0, max_first_visible());
}

auto scrollable_view::last_visible() const -> int
{
  if (config_.item_count == 0) { return 0; }
  return std::min(config_.first_visible + config_.visible_items, config_.item_count) - 1;
}

auto scrollable_view::max_first_visible() const -> int
{
  return std::max(0, config_.item_count - config_.visible_items);
}

auto scrollable_view::is_visible(int index) const -> bool
{
  return config_.item_count > 0 and index >= config_.first_visible and index <= last_visible();
}

auto scrollable_view::snapshot() const -> core::feedback_signal
{
  const int offset = config_.first_visible * config_.pixels_per_item;
  const int max_offset = max_first_visible() * config_.pixels_per_item;

  core::feedback_signal signal{
    .from_index = config_.first_visible, .to_index = last_visible(), .item_count = config_.item_count
  };
  if (config_.axis == core::scroll_axis::vertical) {
    signal.scroll_x = 0;
    signal.max_scroll_x = 0;
    signal.scroll_y = offset;
    signal.max_scroll_y = max_offset;
  } else {
    signal.scroll_x = offset;
    signal.max_scroll_x = max_offset;
    signal.scroll_y = 0;
    signal.max_scroll_y = 0;
  }
  return signal;
}

auto scrollable_view::scroll(core::physical_direction direction) -> std::vector<core::feedback_event>
{
  if (core::standard_direction_converter::axis_of(direction) != config_.axis) { return {}; }

  const bool forward = direction == core::physical_direction::down or direction == core::physical_direction::right;
  const int page = std::max(1, config_.visible_items - 1);
  const int start = config_.first_visible;
  const int target = std::clamp(start + (forward ? page : -page), 0, max_first_visible());

  if (target == start or config_.mode == event_mode::silent) {
    config_.first_visible = target;
    return {};
  }

  std::vector<core::feedback_event> events;

  // Long flings report an intermediate position before settling.
  if (std::abs(target - start) > 1) {
    config_.first_visible = start + (target - start) / 2;
    events.push_back(make_event(snapshot()));
  }

  config_.first_visible = target;
  events.push_back(make_event(snapshot()));
  events.push_back(core::feedback_event{ .types = core::event_type::window_content_changed, .source = config_.name });
  return events;
}

auto scrollable_view::make_event(const core::feedback_signal &position) const -> core::feedback_event
{
  core::feedback_event event{ .types = core::event_type::view_scrolled, .source = config_.name };

  const bool vertical = config_.axis == core::scroll_axis::vertical;
  switch (config_.mode) {
  case event_mode::indexed:
    event.signal.from_index = position.from_index;
    event.signal.to_index = position.to_index;
    event.signal.item_count = position.item_count;
    break;
  case event_mode::offsets:
    if (vertical) {
      event.signal.scroll_y = position.scroll_y;
      event.signal.max_scroll_y = position.max_scroll_y;
    } else {
      event.signal.scroll_x = position.scroll_x;
      event.signal.max_scroll_x = position.max_scroll_x;
    }
    break;
  case event_mode::unrelated:
    if (vertical) {
      event.signal.scroll_x = position.scroll_x;
      event.signal.max_scroll_x = position.max_scroll_x;
    } else {
      event.signal.scroll_y = position.scroll_y;
      event.signal.max_scroll_y = position.max_scroll_y;
    }
    break;
  case event_mode::silent:
  case event_mode::empty:
    break;
  }
  return event;
}

}// namespace scroll_driver::sim
