#include <driver/screenshot.hpp>

namespace scroll_driver::driver {

auto compose_at_location(const image &drawing_cache, point location) -> image
{
  if (location == point{ 0, 0 }) { return drawing_cache; }

  image screenshot(drawing_cache.width() + location.x, drawing_cache.height() + location.y, transparent);
  screenshot.draw(drawing_cache, location);
  return screenshot;
}

}// namespace scroll_driver::driver
