#pragma once

#include <stdexcept>
#include <string>

namespace scroll_driver::driver {

/// A polled condition did not come true within its timeout
class timeout_error : public std::runtime_error
{
public:
  explicit timeout_error(const std::string &what) : std::runtime_error(what) {}
};

}// namespace scroll_driver::driver
