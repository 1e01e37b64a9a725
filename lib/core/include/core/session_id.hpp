#pragma once

#include <string>

namespace scroll_driver::core {

/**
 * @brief Generates identifiers that correlate the log lines of one scroll session.
 */
class session_id
{
public:
  /**
   * @brief Generates a new session identifier.
   *
   * @return RFC 4122 UUID string (e.g., "550e8400-e29b-41d4-a716-446655440000")
   */
  [[nodiscard]] static auto generate() -> std::string;
};

}// namespace scroll_driver::core
