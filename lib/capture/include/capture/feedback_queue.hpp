#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <core/feedback.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <variant>

namespace scroll_driver::capture {

/// What the platform binding can deliver on the feedback stream
using feedback_message = std::variant<core::feedback_event, core::capture_complete>;

/**
 * @brief Thread-safe channel carrying platform feedback to the capture adapter.
 *
 * The platform binding pushes events as they happen; the capture adapter waits for them
 * with a hard deadline. Deadline expiry is a regular outcome, not an error.
 */
class feedback_queue
{
public:
  /// Maximum number of undelivered messages
  static const std::size_t channel_size{ 1024 };

  using clock_t = std::chrono::steady_clock;

  /**
   * @brief Constructs a new feedback queue.
   *
   * @param io_context Shared pointer to the Boost.Asio io_context used for waiting
   */
  explicit feedback_queue(const std::shared_ptr<boost::asio::io_context> &io_context)
    : io_context_(io_context), channel_(*io_context_, channel_size), size_(0)
  {}

  feedback_queue(const feedback_queue &) = delete;
  auto operator=(const feedback_queue &) -> feedback_queue & = delete;
  feedback_queue(feedback_queue &&) = delete;
  auto operator=(feedback_queue &&) -> feedback_queue & = delete;
  ~feedback_queue() = default;

  /**
   * @brief Delivers a message (non-blocking).
   *
   * Messages pushed after close() or beyond channel_size are dropped.
   *
   * @param message Event or completion notice
   */
  auto push(feedback_message message) -> void
  {
    if (channel_.try_send(boost::system::error_code{}, std::move(message))) {
      ++size_;
    } else {
      spdlog::warn("[feedback_queue] Dropped feedback message, channel closed or full");
    }
  }

  /**
   * @brief Waits for the next message until the deadline passes.
   *
   * @param deadline Point in time after which waiting stops
   * @return Awaitable yielding the next message, or std::nullopt when the deadline passed
   * @throws boost::system::system_error when the queue was closed
   */
  auto pop_until(clock_t::time_point deadline) -> boost::asio::awaitable<std::optional<feedback_message>>
  {
    if (not channel_.is_open()) {
      throw boost::system::system_error(boost::asio::experimental::error::channel_closed);
    }
    if (auto ready = try_pop()) { co_return ready; }
    if (clock_t::now() >= deadline) { co_return std::nullopt; }

    auto executor = co_await boost::asio::this_coro::executor;
    auto cancel_signal = std::make_shared<boost::asio::cancellation_signal>();
    auto waiting = std::make_shared<bool>(true);

    boost::asio::steady_timer deadline_timer(executor, deadline);
    deadline_timer.async_wait([cancel_signal, waiting](const boost::system::error_code &error) {
      if (not error and *waiting) { cancel_signal->emit(boost::asio::cancellation_type::terminal); }
    });

    boost::system::error_code err;
    auto message = co_await channel_.async_receive(boost::asio::bind_cancellation_slot(
      cancel_signal->slot(), boost::asio::redirect_error(boost::asio::use_awaitable, err)));
    *waiting = false;
    deadline_timer.cancel();

    if (err == boost::asio::experimental::error::channel_cancelled or err == boost::asio::error::operation_aborted) {
      co_return std::nullopt;
    }
    if (err) { throw boost::system::system_error(err); }

    --size_;
    co_return message;
  }

  /**
   * @brief Takes a message without waiting.
   *
   * @return The next message if one is ready, std::nullopt otherwise
   */
  auto try_pop() -> std::optional<feedback_message>
  {
    std::optional<feedback_message> message;
    const bool received =
      channel_.try_receive([&message](boost::system::error_code error, feedback_message rx_message) {
        if (not error) { message = std::move(rx_message); }
      });

    if (received and message.has_value()) {
      --size_;
      return message;
    }
    return std::nullopt;
  }

  /**
   * @brief Drops every message that is already waiting.
   *
   * @return Number of messages dropped
   */
  auto discard_pending() -> std::size_t
  {
    std::size_t discarded = 0;
    while (try_pop()) { ++discarded; }
    return discarded;
  }

  [[nodiscard]] auto empty() const -> bool { return size_.load() == 0; }

  [[nodiscard]] auto size() const -> std::size_t { return size_.load(); }

  [[nodiscard]] auto is_open() const -> bool { return channel_.is_open(); }

  /**
   * @brief Closes the queue; pending and future waits fail with channel_closed.
   */
  auto close() -> void { channel_.close(); }

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
  boost::asio::experimental::concurrent_channel<void(boost::system::error_code, feedback_message)> channel_;
  std::atomic<std::size_t> size_;
};

}// namespace scroll_driver::capture
