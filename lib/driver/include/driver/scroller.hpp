#pragma once

#include <boost/asio/awaitable.hpp>
#include <concepts/scroll_stepper.hpp>
#include <core/direction.hpp>
#include <core/locator.hpp>
#include <core/scroll_step.hpp>
#include <functional>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace scroll_driver::driver {

/// Outcome of a multi-step scroll operation
struct scroll_summary
{
  std::string session_id;
  bool found = false;///< The stop condition held
  bool reached_end = false;///< The container could not scroll any further
  bool gave_up = false;///< The step limit was hit first
  int steps = 0;///< Scroll steps requested
  int gestures = 0;///< Steps that actually issued a gesture
  std::vector<core::scroll_step_result> trail;///< Every step in order
};

/**
 * @brief Repeats scroll steps toward a goal within one session.
 *
 * @tparam Stepper Type satisfying the scroll_stepper concept
 *
 * Gives up after max_scrolls steps. The session is ended on every exit path.
 */
template<concepts::scroll_stepper Stepper> class scroller
{
public:
  static constexpr int default_max_scrolls = 100;

  explicit scroller(std::shared_ptr<Stepper> stepper, int max_scrolls = default_max_scrolls)
    : stepper_(std::move(stepper)), max_scrolls_(max_scrolls)
  {}

  /**
   * @brief Scrolls until the container cannot move any further.
   */
  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto scroll_to_end(core::container_ref container, core::physical_direction direction)
    -> boost::asio::awaitable<scroll_summary>
  {
    co_return co_await scroll_until(std::move(container), direction, []() { return false; });
  }

  /**
   * @brief Scrolls until found() holds or the container cannot move any further.
   *
   * @param container Container to scroll
   * @param direction Direction of every gesture
   * @param found Checked before each step
   * @return Awaitable yielding the summary of the operation
   * @throws core::unrecoverable_error when a step cannot be performed
   */
  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto scroll_until(core::container_ref container, core::physical_direction direction, std::function<bool()> found)
    -> boost::asio::awaitable<scroll_summary>
  {
    const session_guard guard(*stepper_);

    scroll_summary summary{ .session_id = stepper_->get_session_id() };

    while (true) {
      if (found()) {
        summary.found = true;
        break;
      }
      if (summary.steps >= max_scrolls_) {
        spdlog::warn("[scroller] Giving up on {} after {} steps", container->description, summary.steps);
        summary.gave_up = true;
        break;
      }

      auto step = co_await stepper_->scroll(container, direction);
      ++summary.steps;
      if (step.gesture_performed) { ++summary.gestures; }

      const auto can_continue = step.can_continue();
      summary.trail.push_back(std::move(step));
      if (not can_continue) {
        summary.reached_end = true;
        summary.found = found();
        break;
      }
    }

    spdlog::debug("[scroller] {} {} finished after {} steps (found={}, end={})",
      container->description,
      direction,
      summary.steps,
      summary.found,
      summary.reached_end);
    co_return summary;
  }

  [[nodiscard]] auto get_max_scrolls() const -> int { return max_scrolls_; }

private:
  class session_guard
  {
  public:
    explicit session_guard(Stepper &stepper) : stepper_(stepper) { stepper_.begin_session(); }
    session_guard(const session_guard &) = delete;
    auto operator=(const session_guard &) -> session_guard & = delete;
    session_guard(session_guard &&) = delete;
    auto operator=(session_guard &&) -> session_guard & = delete;
    ~session_guard() { stepper_.end_session(); }

  private:
    Stepper &stepper_;
  };

  std::shared_ptr<Stepper> stepper_;
  int max_scrolls_;
};

}// namespace scroll_driver::driver
