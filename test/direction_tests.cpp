#include <catch2/catch_test_macros.hpp>
#include <core/direction.hpp>
#include <fmt/format.h>

using namespace scroll_driver::core;

TEST_CASE("standard_direction_converter maps directions to axes", "[direction][converter]")
{
  const standard_direction_converter converter;

  CHECK(converter.axis_of(physical_direction::up) == scroll_axis::vertical);
  CHECK(converter.axis_of(physical_direction::down) == scroll_axis::vertical);
  CHECK(converter.axis_of(physical_direction::left) == scroll_axis::horizontal);
  CHECK(converter.axis_of(physical_direction::right) == scroll_axis::horizontal);
}

TEST_CASE("standard_direction_converter maps logical directions", "[direction][converter][logical]")
{
  const standard_direction_converter converter;

  CHECK(converter.to_physical(scroll_axis::vertical, logical_direction::forward) == physical_direction::down);
  CHECK(converter.to_physical(scroll_axis::vertical, logical_direction::backward) == physical_direction::up);
  CHECK(converter.to_physical(scroll_axis::horizontal, logical_direction::forward) == physical_direction::right);
  CHECK(converter.to_physical(scroll_axis::horizontal, logical_direction::backward) == physical_direction::left);
}

TEST_CASE("directions parse from and format to their names", "[direction][parse]")
{
  CHECK(parse_physical_direction("up") == physical_direction::up);
  CHECK(parse_physical_direction("down") == physical_direction::down);
  CHECK(parse_physical_direction("left") == physical_direction::left);
  CHECK(parse_physical_direction("right") == physical_direction::right);
  CHECK_FALSE(parse_physical_direction("DOWN").has_value());
  CHECK_FALSE(parse_physical_direction("").has_value());

  CHECK(fmt::format("{}", physical_direction::left) == "left");
  CHECK(fmt::format("{}", scroll_axis::horizontal) == "horizontal");
  CHECK(fmt::format("{}", logical_direction::backward) == "backward");
}
