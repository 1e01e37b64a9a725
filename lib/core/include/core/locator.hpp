#pragma once

#include <memory>
#include <string>
#include <utility>

namespace scroll_driver::core {

/**
 * @brief Describes how a container is found on screen.
 *
 * A locator is compared by identity, never by content: two locators built from the same
 * description are different containers as far as scroll bookkeeping is concerned.
 * Callers hold locators through container_ref and reuse the same object across the
 * steps of one scroll operation.
 */
struct locator
{
  std::string description;
};

using container_ref = std::shared_ptr<const locator>;

[[nodiscard]] inline auto make_locator(std::string description) -> container_ref
{
  return std::make_shared<const locator>(locator{ .description = std::move(description) });
}

/// True when both references name the very same locator object
[[nodiscard]] inline auto same_container(const container_ref &lhs, const container_ref &rhs) -> bool
{
  return lhs.get() == rhs.get();
}

}// namespace scroll_driver::core
