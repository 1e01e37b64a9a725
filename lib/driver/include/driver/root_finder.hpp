#pragma once

#include <algorithm>
#include <chrono>
#include <concepts/root_view.hpp>
#include <driver/errors.hpp>
#include <fmt/format.h>
#include <memory>
#include <spdlog/spdlog.h>
#include <thread>
#include <utility>

namespace scroll_driver::driver {

/**
 * @brief Finds the root view the driver should work on.
 *
 * @tparam Source Type satisfying the window_source concept
 */
template<concepts::window_source Source> class root_finder
{
public:
  using view_t = typename Source::view_t;

  static constexpr std::chrono::milliseconds default_poll_interval{ 250 };

  /**
   * @brief Constructs a root finder.
   *
   * @param source Platform window bookkeeping
   * @param timeout How long to wait for a foreground activity
   * @param poll_interval Longest pause between two polls
   */
  root_finder(std::shared_ptr<Source> source,
    std::chrono::milliseconds timeout,
    std::chrono::milliseconds poll_interval = default_poll_interval)
    : source_(std::move(source)), timeout_(timeout), poll_interval_(poll_interval)
  {}

  /**
   * @brief Returns the focused root view, or the foreground activity's decor view.
   *
   * @throws timeout_error when no activity reaches the foreground within the timeout
   */
  [[nodiscard]] auto find_root_view() -> view_t
  {
    auto decor_view = wait_for_foreground();

    auto views = source_->root_views();
    if (views.size() > 1) {
      spdlog::trace("[root_finder] views.size()={}", views.size());
      auto focused = std::ranges::find_if(views, [](const view_t &view) { return view.has_window_focus(); });
      if (focused != views.end()) { return *focused; }
    }
    return decor_view;
  }

  [[nodiscard]] auto get_timeout() const -> std::chrono::milliseconds { return timeout_; }

private:
  auto wait_for_foreground() -> view_t
  {
    using clock_t = std::chrono::steady_clock;
    const auto end = clock_t::now() + timeout_;

    while (true) {
      if (auto decor_view = source_->foreground_decor_view()) { return *decor_view; }

      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(end - clock_t::now());
      if (remaining.count() < 0) {
        throw timeout_error(fmt::format(
          "Timed out after {} milliseconds waiting for foreground activity", timeout_.count()));
      }
      std::this_thread::sleep_for(std::min(poll_interval_, remaining));
    }
  }

  std::shared_ptr<Source> source_;
  std::chrono::milliseconds timeout_;
  std::chrono::milliseconds poll_interval_;
};

}// namespace scroll_driver::driver
