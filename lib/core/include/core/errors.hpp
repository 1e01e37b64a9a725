#pragma once

#include <stdexcept>
#include <string>

namespace scroll_driver::core {

/**
 * @brief The platform scroll or event mechanism cannot be engaged at all.
 *
 * Never retried. Terminates the current step and the session it belongs to.
 */
class unrecoverable_error : public std::runtime_error
{
public:
  explicit unrecoverable_error(const std::string &what) : std::runtime_error(what) {}
};

}// namespace scroll_driver::core
