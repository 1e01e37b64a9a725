#pragma once

namespace scroll_driver::core {

/**
 * @brief Builds a visitor out of one lambda per variant alternative.
 *
 * @code
 * std::visit(overload{
 *   [](const feedback_event &event) { keep(event); },
 *   [](const capture_complete &) { stop(); }
 * }, message);
 * @endcode
 */
template<class... Ts> struct overload : Ts...
{
  using Ts::operator()...;
};

template<class... Ts> overload(Ts...) -> overload<Ts...>;

}// namespace scroll_driver::core
