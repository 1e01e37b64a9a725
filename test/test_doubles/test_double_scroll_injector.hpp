#pragma once

#include <capture/feedback_queue.hpp>
#include <concepts/scroll_injector.hpp>
#include <core/direction.hpp>
#include <core/errors.hpp>
#include <core/locator.hpp>
#include <memory>
#include <utility>
#include <vector>

namespace scroll_driver::test {

/**
 * Delivers a scripted burst of feedback messages for every gesture it performs.
 */
class test_double_scroll_injector
{
public:
  explicit test_double_scroll_injector(std::shared_ptr<capture::feedback_queue> queue) : queue_(std::move(queue)) {}

  auto set_messages(std::vector<capture::feedback_message> messages) -> void { messages_ = std::move(messages); }

  auto set_failure(bool fail) -> void { should_fail_ = fail; }

  auto perform_scroll(const core::container_ref &container, core::physical_direction direction) -> void
  {
    if (should_fail_) { throw core::unrecoverable_error("injection refused"); }
    gestures_.emplace_back(container, direction);
    for (const auto &message : messages_) { queue_->push(message); }
  }

  [[nodiscard]] auto get_gesture_count() const -> std::size_t { return gestures_.size(); }

  [[nodiscard]] auto get_gestures() const
    -> const std::vector<std::pair<core::container_ref, core::physical_direction>> &
  {
    return gestures_;
  }

private:
  std::shared_ptr<capture::feedback_queue> queue_;
  std::vector<capture::feedback_message> messages_;
  std::vector<std::pair<core::container_ref, core::physical_direction>> gestures_;
  bool should_fail_ = false;
};

static_assert(scroll_driver::concepts::scroll_injector<test_double_scroll_injector>);

}// namespace scroll_driver::test
