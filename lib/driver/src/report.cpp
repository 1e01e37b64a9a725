#include <driver/report.hpp>

#include <fmt/format.h>
#include <fstream>
#include <stdexcept>
#include <string>

namespace scroll_driver::driver {

auto signal_to_json(const core::feedback_signal &signal) -> nlohmann::json
{
  auto json = nlohmann::json::object();
  auto add = [&json](const char *name, int value) {
    if (value != core::unset_field) { json[name] = value; }
  };

  add("from_index", signal.from_index);
  add("to_index", signal.to_index);
  add("item_count", signal.item_count);
  add("scroll_x", signal.scroll_x);
  add("scroll_y", signal.scroll_y);
  add("max_scroll_x", signal.max_scroll_x);
  add("max_scroll_y", signal.max_scroll_y);
  return json;
}

auto summary_to_json(const scroll_summary &summary) -> nlohmann::json
{
  auto trail = nlohmann::json::array();
  for (const auto &step : summary.trail) {
    trail.push_back({
      { "outcome", std::string(core::to_string(step.outcome)) },
      { "gesture_performed", step.gesture_performed },
      { "signal", step.signal.has_value() ? signal_to_json(*step.signal) : nlohmann::json(nullptr) },
    });
  }

  return {
    { "session_id", summary.session_id },
    { "found", summary.found },
    { "reached_end", summary.reached_end },
    { "gave_up", summary.gave_up },
    { "steps", summary.steps },
    { "gestures", summary.gestures },
    { "trail", trail },
  };
}

auto write_report(const scroll_summary &summary, const std::filesystem::path &path) -> void
{
  std::ofstream out(path);
  if (not out) { throw std::runtime_error(fmt::format("cannot open {} for writing", path.string())); }

  constexpr int indent = 2;
  out << summary_to_json(summary).dump(indent) << '\n';
}

}// namespace scroll_driver::driver
