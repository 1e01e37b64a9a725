#include <sim/device.hpp>

#include <core/errors.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace scroll_driver::sim {

device::device(std::shared_ptr<capture::feedback_queue> feedback, device_config config)
  : feedback_(std::move(feedback)), config_(config)
{}

auto device::add_scrollable(view_config config) -> scrollable_view &
{
  auto name = config.name;
  auto [iter, inserted] = views_.try_emplace(name, std::move(config));
  if (not inserted) { throw std::invalid_argument(fmt::format("container {} already exists", name)); }
  return iter->second;
}

auto device::find_scrollable(const std::string &name) -> scrollable_view *
{
  auto iter = views_.find(name);
  return iter != views_.end() ? &iter->second : nullptr;
}

auto device::perform_scroll(const core::container_ref &container, core::physical_direction direction) -> void
{
  if (not connected_) { throw core::unrecoverable_error("gesture injection unavailable: device disconnected"); }

  auto *view = find_scrollable(container->description);
  if (view == nullptr) {
    throw core::unrecoverable_error(fmt::format("no container matches {}", container->description));
  }

  ++gesture_count_;
  auto events = view->scroll(direction);
  spdlog::trace("[device] Swipe {} on {} emitted {} events", direction, container->description, events.size());

  for (auto &event : events) { feedback_->push(std::move(event)); }
  if (config_.signal_completion) { feedback_->push(core::capture_complete{}); }
}

auto device::launch(activity foreground) -> void { foreground_ = std::move(foreground); }

auto device::add_window(window overlay) -> void { overlays_.push_back(std::move(overlay)); }

auto device::foreground_decor_view() -> std::optional<window>
{
  ++foreground_polls_;
  if (foreground_polls_ <= config_.polls_until_foreground or not foreground_.has_value()) { return std::nullopt; }
  return foreground_->decor_view;
}

auto device::root_views() -> std::vector<window>
{
  std::vector<window> views;
  if (foreground_.has_value()) { views.push_back(foreground_->decor_view); }
  views.insert(views.end(), overlays_.begin(), overlays_.end());
  return views;
}

}// namespace scroll_driver::sim
