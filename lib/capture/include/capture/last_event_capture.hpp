#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <capture/feedback_queue.hpp>
#include <chrono>
#include <concepts/event_capture.hpp>
#include <concepts/scroll_injector.hpp>
#include <core/direction.hpp>
#include <core/errors.hpp>
#include <core/feedback.hpp>
#include <core/locator.hpp>
#include <core/overload.hpp>
#include <fmt/format.h>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <utility>
#include <variant>

namespace scroll_driver::capture {

/**
 * @brief Performs one gesture and keeps the last scroll event it produced.
 *
 * @tparam Injector Type satisfying the scroll_injector concept
 *
 * Every scroll event that arrives within the timeout replaces the one held before it,
 * so at most one event is retained however chatty the container is. Events of other
 * types are dropped on arrival.
 */
template<concepts::scroll_injector Injector> class last_event_capture
{
public:
  /**
   * @brief Constructs the capture adapter.
   *
   * @param injector Platform binding that performs the gesture
   * @param queue Feedback stream fed by the same platform binding
   * @param scroll_event_timeout How long to collect events after each gesture
   */
  last_event_capture(std::shared_ptr<Injector> injector,
    std::shared_ptr<feedback_queue> queue,
    std::chrono::milliseconds scroll_event_timeout)
    : injector_(std::move(injector)), queue_(std::move(queue)), scroll_event_timeout_(scroll_event_timeout)
  {}

  /**
   * @brief Scrolls the container once and returns the last scroll feedback.
   *
   * @param container Container to scroll
   * @param direction Direction of the gesture
   * @return Awaitable yielding the last scroll signal, or std::nullopt when the timeout
   *         elapsed or the platform reported completion without one
   * @throws core::unrecoverable_error when the gesture or the feedback stream cannot be engaged
   */
  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto capture(core::container_ref container, core::physical_direction direction)
    -> boost::asio::awaitable<std::optional<core::feedback_signal>>
  {
    if (not queue_->is_open()) { throw core::unrecoverable_error("feedback stream is closed"); }

    if (const auto stale = queue_->discard_pending(); stale > 0) {
      spdlog::trace("[last_event_capture] Discarded {} stale feedback messages", stale);
    }

    injector_->perform_scroll(container, direction);

    const auto deadline = feedback_queue::clock_t::now() + scroll_event_timeout_;
    std::optional<core::feedback_event> last_event;

    try {
      bool complete = false;
      while (not complete) {
        auto message = co_await queue_->pop_until(deadline);
        if (not message.has_value()) { break; }

        complete = std::visit(core::overload{ [&last_event](core::feedback_event &event) {
                                               if (event.is_scroll()) { last_event = std::move(event); }
                                               return false;
                                             },
                                [](core::capture_complete & /*done*/) { return true; } },
          *message);
      }
    } catch (const boost::system::system_error &err) {
      throw core::unrecoverable_error(fmt::format("feedback stream failed: {}", err.what()));
    }

    if (not last_event.has_value()) {
      spdlog::trace("[last_event_capture] No scroll event for {} within {}ms",
        container->description,
        scroll_event_timeout_.count());
      co_return std::nullopt;
    }

    co_return last_event->signal;
  }

  [[nodiscard]] auto get_timeout() const -> std::chrono::milliseconds { return scroll_event_timeout_; }

private:
  std::shared_ptr<Injector> injector_;
  std::shared_ptr<feedback_queue> queue_;
  std::chrono::milliseconds scroll_event_timeout_;
};

}// namespace scroll_driver::capture
