#pragma once

#include <core/direction.hpp>
#include <core/locator.hpp>
#include <optional>

namespace scroll_driver::core {

/**
 * @brief Remembers the container and direction of the last confirmed scroll end.
 *
 * Single slot, last write wins. A repeated scroll on the very same locator object in the
 * same direction can be answered from here without issuing another gesture. The slot only
 * ever describes the immediately preceding scroll call.
 */
class end_session_memo
{
public:
  end_session_memo() = default;

  /// Clears the memo at the start of a multi-step scroll operation
  auto begin_session() -> void { clear(); }

  /// Forgets the recorded end; a request for any other container or direction does this
  auto clear() -> void { end_.reset(); }

  /// Nothing to do; kept so sessions open and close symmetrically
  auto end_session() -> void {}

  [[nodiscard]] auto matches_last_end(const container_ref &container, physical_direction direction) const -> bool
  {
    return end_.has_value() and same_container(end_->container, container) and end_->direction == direction;
  }

  auto record_end(container_ref container, physical_direction direction) -> void
  {
    end_ = end_data{ .container = std::move(container), .direction = direction };
  }

  [[nodiscard]] auto empty() const -> bool { return not end_.has_value(); }

private:
  struct end_data
  {
    container_ref container;
    physical_direction direction;
  };

  std::optional<end_data> end_;
};

}// namespace scroll_driver::core
