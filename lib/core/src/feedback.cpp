#include <core/feedback.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <string>
#include <utility>
#include <vector>

namespace scroll_driver::core {

auto describe(const feedback_signal &signal) -> std::string
{
  const std::pair<const char *, int> fields[] = {
    { "from_index", signal.from_index },
    { "to_index", signal.to_index },
    { "item_count", signal.item_count },
    { "scroll_x", signal.scroll_x },
    { "scroll_y", signal.scroll_y },
    { "max_scroll_x", signal.max_scroll_x },
    { "max_scroll_y", signal.max_scroll_y },
  };

  std::vector<std::string> populated;
  for (const auto &[name, value] : fields) {
    if (value != unset_field) { populated.push_back(fmt::format("{}={}", name, value)); }
  }

  return fmt::format("{{{}}}", fmt::join(populated, ", "));
}

}// namespace scroll_driver::core
