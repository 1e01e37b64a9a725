#pragma once

#include <concepts>
#include <driver/image.hpp>
#include <optional>
#include <vector>

namespace scroll_driver::concepts {

/**
 * @brief Concept for a top-level view the driver can inspect and capture.
 *
 * render() produces the view's drawing cache and must only be called on the main thread.
 */
template<typename T>
concept root_view = std::copyable<T> and requires(const T &view) {
  { view.has_window_focus() } -> std::same_as<bool>;
  { view.location_on_screen() } -> std::same_as<driver::point>;
  { view.render() } -> std::same_as<driver::image>;
};

/**
 * @brief Concept for the platform's window bookkeeping.
 *
 * foreground_decor_view() yields the decor view of the running activity, or
 * std::nullopt while no activity is in the foreground.
 */
template<typename T>
concept window_source = requires(T &source) {
  typename T::view_t;
  requires root_view<typename T::view_t>;
  { source.foreground_decor_view() } -> std::same_as<std::optional<typename T::view_t>>;
  { source.root_views() } -> std::same_as<std::vector<typename T::view_t>>;
};

}// namespace scroll_driver::concepts
