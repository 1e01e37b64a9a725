#pragma once

#include <core/feedback.hpp>
#include <driver/scroller.hpp>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace scroll_driver::driver {

/**
 * @brief Serializes the populated fields of a signal.
 *
 * @return JSON object with one member per populated field ({} when empty)
 */
[[nodiscard]] auto signal_to_json(const core::feedback_signal &signal) -> nlohmann::json;

/**
 * @brief Serializes a scroll summary, including the per-step trail.
 *
 * Steps without a signal carry "signal": null.
 */
[[nodiscard]] auto summary_to_json(const scroll_summary &summary) -> nlohmann::json;

/**
 * @brief Writes the summary as pretty-printed JSON.
 *
 * @throws std::runtime_error when the file cannot be written
 */
auto write_report(const scroll_summary &summary, const std::filesystem::path &path) -> void;

}// namespace scroll_driver::driver
