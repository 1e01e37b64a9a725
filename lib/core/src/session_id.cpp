#include <core/session_id.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace scroll_driver::core {

auto session_id::generate() -> std::string
{
  static thread_local boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

}// namespace scroll_driver::core
