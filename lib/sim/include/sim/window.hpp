#pragma once

#include <concepts/root_view.hpp>
#include <driver/image.hpp>
#include <string>

namespace scroll_driver::sim {

/**
 * @brief A top-level window rendering as a solid block of colour.
 */
struct window
{
  std::string title;
  bool focused = false;
  driver::point location;
  int width = 0;
  int height = 0;
  driver::pixel_t color = 0xFF000000;

  [[nodiscard]] auto has_window_focus() const -> bool { return focused; }

  [[nodiscard]] auto location_on_screen() const -> driver::point { return location; }

  [[nodiscard]] auto render() const -> driver::image { return { width, height, color }; }
};

static_assert(concepts::root_view<window>);

/// An activity and the decor view of its window
struct activity
{
  std::string name;
  window decor_view;
};

}// namespace scroll_driver::sim
