#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <capture/feedback_queue.hpp>
#include <capture/last_event_capture.hpp>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <core/direction.hpp>
#include <core/errors.hpp>
#include <core/feedback.hpp>
#include <core/locator.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <tuple>

#include "test_doubles/test_double_scroll_injector.hpp"

using namespace scroll_driver;
using namespace std::chrono_literals;

namespace {

auto event_of(std::uint32_t types, core::feedback_signal signal) -> capture::feedback_message
{
  return core::feedback_event{ .types = types, .signal = signal, .source = "list" };
}

auto scrolled_to(int from_index, int to_index) -> capture::feedback_message
{
  return event_of(core::event_type::view_scrolled,
    core::feedback_signal{ .from_index = from_index, .to_index = to_index, .item_count = 40 });
}

struct capture_fixture
{
  std::shared_ptr<boost::asio::io_context> io_context = std::make_shared<boost::asio::io_context>();
  std::shared_ptr<capture::feedback_queue> queue = std::make_shared<capture::feedback_queue>(io_context);
  std::shared_ptr<test::test_double_scroll_injector> injector =
    std::make_shared<test::test_double_scroll_injector>(queue);

  auto capture_once(std::chrono::milliseconds timeout,
    const core::container_ref &container = core::make_locator("list"),
    core::physical_direction direction = core::physical_direction::down) -> std::optional<core::feedback_signal>
  {
    capture::last_event_capture<test::test_double_scroll_injector> adapter(injector, queue, timeout);
    auto pending =
      boost::asio::co_spawn(*io_context, adapter.capture(container, direction), boost::asio::use_future);
    io_context->run();
    io_context->restart();
    return pending.get();
  }
};

}// namespace

SCENARIO("last_event_capture keeps the last scroll event", "[last_event_capture]")
{
  GIVEN("an injector that reports several events per gesture")
  {
    capture_fixture fixture;

    WHEN("multiple scroll events arrive")
    {
      fixture.injector->set_messages({ scrolled_to(5, 14), scrolled_to(10, 19), core::capture_complete{} });
      const auto signal = fixture.capture_once(500ms);

      THEN("only the last one is returned")
      {
        REQUIRE(signal.has_value());
        CHECK(signal->from_index == 10);
        CHECK(signal->to_index == 19);
      }
    }

    WHEN("a non-scroll event follows the last scroll event")
    {
      fixture.injector->set_messages({ scrolled_to(10, 19),
        event_of(core::event_type::window_content_changed, core::feedback_signal{ .from_index = 99 }),
        core::capture_complete{} });
      const auto signal = fixture.capture_once(500ms);

      THEN("the other event does not replace it")
      {
        REQUIRE(signal.has_value());
        CHECK(signal->from_index == 10);
      }
    }

    WHEN("only non-scroll events arrive")
    {
      fixture.injector->set_messages({ event_of(core::event_type::view_focused, core::feedback_signal{}),
        event_of(core::event_type::view_clicked, core::feedback_signal{ .item_count = 4 }),
        core::capture_complete{} });
      const auto signal = fixture.capture_once(500ms);

      THEN("there is no signal") { CHECK_FALSE(signal.has_value()); }
    }

    WHEN("an event carries several type bits including scrolled")
    {
      constexpr auto types = core::event_type::view_scrolled | core::event_type::window_content_changed;
      fixture.injector->set_messages(
        { event_of(types, core::feedback_signal{ .scroll_y = 75, .max_scroll_y = 150 }), core::capture_complete{} });
      const auto signal = fixture.capture_once(500ms);

      THEN("it counts as a scroll event")
      {
        REQUIRE(signal.has_value());
        CHECK(signal->scroll_y == 75);
      }
    }
  }
}

TEST_CASE("last_event_capture waits the full timeout without completion", "[last_event_capture][timeout]")
{
  capture_fixture fixture;
  fixture.injector->set_messages({ scrolled_to(10, 19) });

  const auto started = std::chrono::steady_clock::now();
  const auto signal = fixture.capture_once(40ms);
  const auto waited = std::chrono::steady_clock::now() - started;

  REQUIRE(signal.has_value());
  CHECK(signal->from_index == 10);
  CHECK(waited >= 35ms);
}

TEST_CASE("last_event_capture returns nothing when the platform stays silent", "[last_event_capture][timeout]")
{
  capture_fixture fixture;

  const auto signal = fixture.capture_once(20ms);

  CHECK_FALSE(signal.has_value());
  CHECK(fixture.injector->get_gesture_count() == 1);
}

TEST_CASE("last_event_capture returns early on completion", "[last_event_capture][completion]")
{
  capture_fixture fixture;
  fixture.injector->set_messages({ scrolled_to(0, 9), core::capture_complete{} });

  const auto started = std::chrono::steady_clock::now();
  const auto signal = fixture.capture_once(5s);
  const auto waited = std::chrono::steady_clock::now() - started;

  REQUIRE(signal.has_value());
  CHECK(waited < 1s);
}

TEST_CASE("last_event_capture ignores feedback from before the gesture", "[last_event_capture][stale]")
{
  capture_fixture fixture;
  fixture.queue->push(scrolled_to(30, 39));
  fixture.injector->set_messages({ core::capture_complete{} });

  const auto signal = fixture.capture_once(500ms);

  CHECK_FALSE(signal.has_value());
}

TEST_CASE("last_event_capture passes the request to the injector", "[last_event_capture][gesture]")
{
  capture_fixture fixture;
  const auto grid = core::make_locator("grid");
  fixture.injector->set_messages({ core::capture_complete{} });

  std::ignore = fixture.capture_once(100ms, grid, core::physical_direction::left);

  REQUIRE(fixture.injector->get_gesture_count() == 1);
  CHECK(fixture.injector->get_gestures().front().first.get() == grid.get());
  CHECK(fixture.injector->get_gestures().front().second == core::physical_direction::left);
}

TEST_CASE("last_event_capture escalates platform failures", "[last_event_capture][errors]")
{
  capture_fixture fixture;

  SECTION("injection failure")
  {
    fixture.injector->set_failure(true);
    CHECK_THROWS_AS(fixture.capture_once(100ms), core::unrecoverable_error);
  }

  SECTION("closed feedback stream")
  {
    fixture.queue->close();
    CHECK_THROWS_AS(fixture.capture_once(100ms), core::unrecoverable_error);
    CHECK(fixture.injector->get_gesture_count() == 0);
  }
}
