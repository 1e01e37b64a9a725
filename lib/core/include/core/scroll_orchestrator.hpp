#pragma once

#include <boost/asio/awaitable.hpp>
#include <concepts/direction_converter.hpp>
#include <concepts/end_detector.hpp>
#include <concepts/event_capture.hpp>
#include <core/direction.hpp>
#include <core/end_session_memo.hpp>
#include <core/errors.hpp>
#include <core/feedback.hpp>
#include <core/locator.hpp>
#include <core/scroll_step.hpp>
#include <core/session_id.hpp>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace scroll_driver::core {

/**
 * @brief Drives single scroll steps and decides when a container stops moving.
 *
 * @tparam Capture Type satisfying the event_capture concept (performs the gesture)
 * @tparam Detector Type satisfying the end_detector concept (classifies the feedback)
 * @tparam Converter Type satisfying the direction_converter concept
 *
 * A session spans the steps of one caller-level scroll operation. Steps are issued
 * strictly one after another; the orchestrator holds no internal concurrency.
 */
template<concepts::event_capture Capture,
  concepts::end_detector Detector,
  concepts::direction_converter Converter = standard_direction_converter>
class scroll_orchestrator
{
public:
  enum class state {
    idle,
    active,
  };

  /**
   * @brief Constructs an orchestrator in the idle state with an empty memo.
   *
   * @param capture Event capture adapter used to run each gesture
   * @param detector End detection strategy
   * @param converter Direction to axis mapping
   */
  explicit scroll_orchestrator(std::shared_ptr<Capture> capture, Detector detector = {}, Converter converter = {})
    : capture_(std::move(capture)), detector_(std::move(detector)), converter_(std::move(converter))
  {}

  /**
   * @brief Starts a new scroll session.
   *
   * Forgets any end recorded by a previous session.
   */
  auto begin_session() -> void
  {
    memo_.begin_session();
    session_id_ = session_id::generate();
    state_ = state::active;
    spdlog::debug("[scroll_orchestrator] Session {} started", session_id_);
  }

  /**
   * @brief Ends the current scroll session.
   */
  auto end_session() -> void
  {
    memo_.end_session();
    if (state_ == state::active) { spdlog::debug("[scroll_orchestrator] Session {} ended", session_id_); }
    state_ = state::idle;
  }

  /**
   * @brief Performs one scroll step.
   *
   * @param container Container to scroll; compared by identity with earlier steps
   * @param direction Direction of the gesture
   * @return Awaitable yielding the step result
   * @throws std::logic_error when called outside a session
   * @throws unrecoverable_error when the platform cannot perform the gesture; the session
   *         is ended before it propagates
   */
  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto scroll(container_ref container, physical_direction direction) -> boost::asio::awaitable<scroll_step_result>
  {
    if (state_ != state::active) { throw std::logic_error("scroll requested outside of a scroll session"); }

    if (memo_.matches_last_end(container, direction)) {
      spdlog::debug("[scroll_orchestrator] {} already at {} end, skipping gesture", container->description, direction);
      co_return scroll_step_result{ .outcome = scroll_outcome::no_movement, .gesture_performed = false };
    }

    memo_.clear();

    std::optional<feedback_signal> signal;
    try {
      signal = co_await capture_->capture(container, direction);
    } catch (const unrecoverable_error &error) {
      spdlog::error("[scroll_orchestrator] Session {} aborted: {}", session_id_, error.what());
      end_session();
      throw;
    }

    if (detector_.detect_end(signal, converter_.axis_of(direction))) {
      memo_.record_end(container, direction);
      spdlog::debug("[scroll_orchestrator] Reached {} end of {} with signal: {}",
        direction,
        container->description,
        signal.has_value() ? describe(*signal) : std::string("none"));
      co_return scroll_step_result{ .outcome = scroll_outcome::end_reached,
        .gesture_performed = true,
        .signal = std::move(signal) };
    }

    // Missing or stale feedback does not mean the gesture had no effect.
    co_return scroll_step_result{ .outcome = scroll_outcome::continued,
      .gesture_performed = true,
      .signal = std::move(signal) };
  }

  [[nodiscard]] auto get_state() const -> state { return state_; }

  [[nodiscard]] auto get_session_id() const -> const std::string & { return session_id_; }

  [[nodiscard]] auto get_converter() const -> const Converter & { return converter_; }

private:
  std::shared_ptr<Capture> capture_;
  Detector detector_;
  Converter converter_;
  end_session_memo memo_;
  state state_ = state::idle;
  std::string session_id_;
};

}// namespace scroll_driver::core
