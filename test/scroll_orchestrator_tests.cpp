#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <catch2/catch_test_macros.hpp>
#include <core/direction.hpp>
#include <core/end_detector.hpp>
#include <core/errors.hpp>
#include <core/feedback.hpp>
#include <core/locator.hpp>
#include <core/scroll_orchestrator.hpp>
#include <core/scroll_step.hpp>
#include <memory>
#include <optional>
#include <stdexcept>

#include "test_doubles/test_double_event_capture.hpp"

using namespace scroll_driver;

namespace {

template<typename Detector> struct orchestrator_fixture
{
  std::shared_ptr<test::test_double_event_capture> capture = std::make_shared<test::test_double_event_capture>();
  core::scroll_orchestrator<test::test_double_event_capture, Detector> orchestrator{ capture };

  auto step(const core::container_ref &container, core::physical_direction direction) -> core::scroll_step_result
  {
    boost::asio::io_context io_context;
    auto pending =
      boost::asio::co_spawn(io_context, orchestrator.scroll(container, direction), boost::asio::use_future);
    io_context.run();
    return pending.get();
  }
};

auto middle_of_list() -> core::feedback_signal
{
  return core::feedback_signal{ .from_index = 10, .to_index = 19, .item_count = 40 };
}

auto bottom_of_list() -> core::feedback_signal
{
  return core::feedback_signal{ .from_index = 30, .to_index = 39, .item_count = 40 };
}

}// namespace

TEST_CASE("scroll_orchestrator starts idle", "[scroll_orchestrator][lifecycle]")
{
  orchestrator_fixture<core::index_offset_end_detector> fixture;

  CHECK(fixture.orchestrator.get_state() == decltype(fixture.orchestrator)::state::idle);
  CHECK(fixture.orchestrator.get_session_id().empty());
}

TEST_CASE("scroll_orchestrator refuses to scroll outside a session", "[scroll_orchestrator][lifecycle]")
{
  orchestrator_fixture<core::index_offset_end_detector> fixture;
  const auto list = core::make_locator("list");

  CHECK_THROWS_AS(fixture.step(list, core::physical_direction::down), std::logic_error);
  CHECK(fixture.capture->get_capture_count() == 0);

  fixture.orchestrator.begin_session();
  fixture.orchestrator.end_session();

  CHECK_THROWS_AS(fixture.step(list, core::physical_direction::down), std::logic_error);
}

TEST_CASE("scroll_orchestrator gives each session its own id", "[scroll_orchestrator][lifecycle]")
{
  orchestrator_fixture<core::index_offset_end_detector> fixture;

  fixture.orchestrator.begin_session();
  const auto first = fixture.orchestrator.get_session_id();
  CHECK(fixture.orchestrator.get_state() == decltype(fixture.orchestrator)::state::active);
  fixture.orchestrator.end_session();

  fixture.orchestrator.begin_session();
  const auto second = fixture.orchestrator.get_session_id();
  fixture.orchestrator.end_session();

  CHECK_FALSE(first.empty());
  CHECK(first != second);
  CHECK(fixture.orchestrator.get_state() == decltype(fixture.orchestrator)::state::idle);
}

SCENARIO("scroll_orchestrator classifies each step", "[scroll_orchestrator][step]")
{
  GIVEN("an orchestrator in an active session")
  {
    orchestrator_fixture<core::index_offset_end_detector> fixture;
    const auto list = core::make_locator("list");
    fixture.orchestrator.begin_session();

    WHEN("the gesture reports a position in the middle")
    {
      fixture.capture->script(middle_of_list());
      const auto result = fixture.step(list, core::physical_direction::down);

      THEN("the step continues and carries the signal")
      {
        CHECK(result.outcome == core::scroll_outcome::continued);
        CHECK(result.gesture_performed);
        CHECK(result.can_continue());
        REQUIRE(result.signal.has_value());
        CHECK(*result.signal == middle_of_list());
      }
    }

    WHEN("the gesture reports the last item")
    {
      fixture.capture->script(bottom_of_list());
      const auto result = fixture.step(list, core::physical_direction::down);

      THEN("the end is reached after a real gesture")
      {
        CHECK(result.outcome == core::scroll_outcome::end_reached);
        CHECK(result.gesture_performed);
        CHECK_FALSE(result.can_continue());
      }
    }

    WHEN("no feedback arrives before the timeout")
    {
      fixture.capture->script(std::nullopt);
      const auto result = fixture.step(list, core::physical_direction::down);

      THEN("the step is treated as the end")
      {
        CHECK(result.outcome == core::scroll_outcome::end_reached);
        CHECK(result.gesture_performed);
        CHECK_FALSE(result.signal.has_value());
      }

      THEN("a repeat of the same request issues no gesture")
      {
        const auto repeat = fixture.step(list, core::physical_direction::down);
        CHECK(repeat.outcome == core::scroll_outcome::no_movement);
        CHECK_FALSE(repeat.gesture_performed);
        CHECK(fixture.capture->get_capture_count() == 1);
      }
    }
  }
}

SCENARIO("scroll_orchestrator remembers the confirmed end", "[scroll_orchestrator][memo]")
{
  GIVEN("a container whose downward end was confirmed")
  {
    orchestrator_fixture<core::index_offset_end_detector> fixture;
    const auto list = core::make_locator("list");
    fixture.orchestrator.begin_session();
    fixture.capture->script(bottom_of_list());
    REQUIRE(fixture.step(list, core::physical_direction::down).outcome == core::scroll_outcome::end_reached);

    WHEN("the same container is scrolled down again several times")
    {
      const auto second = fixture.step(list, core::physical_direction::down);
      const auto third = fixture.step(list, core::physical_direction::down);

      THEN("no further gestures are issued")
      {
        CHECK(second.outcome == core::scroll_outcome::no_movement);
        CHECK(third.outcome == core::scroll_outcome::no_movement);
        CHECK_FALSE(second.signal.has_value());
        CHECK(fixture.capture->get_capture_count() == 1);
      }
    }

    WHEN("the same container is scrolled the other way")
    {
      fixture.capture->script(middle_of_list());
      const auto result = fixture.step(list, core::physical_direction::up);

      THEN("a gesture is issued") { CHECK(result.outcome == core::scroll_outcome::continued); }

      THEN("the downward end is forgotten and the next downward request scrolls again")
      {
        fixture.capture->script(middle_of_list());
        const auto back_down = fixture.step(list, core::physical_direction::down);
        CHECK(back_down.outcome == core::scroll_outcome::continued);
        CHECK(back_down.gesture_performed);
        CHECK(fixture.capture->get_capture_count() == 3);
      }
    }

    WHEN("a structurally equal but distinct locator is scrolled")
    {
      fixture.capture->script(middle_of_list());
      const auto result = fixture.step(core::make_locator("list"), core::physical_direction::down);

      THEN("a gesture is issued")
      {
        CHECK(result.gesture_performed);
        CHECK(fixture.capture->get_capture_count() == 2);
      }

      THEN("the original locator no longer matches the recorded end")
      {
        const auto again = fixture.step(list, core::physical_direction::down);
        CHECK(again.gesture_performed);
        CHECK(fixture.capture->get_capture_count() == 3);
      }
    }

    WHEN("a new session starts")
    {
      fixture.orchestrator.end_session();
      fixture.orchestrator.begin_session();
      fixture.capture->script(bottom_of_list());
      const auto result = fixture.step(list, core::physical_direction::down);

      THEN("the end is confirmed again with a real gesture")
      {
        CHECK(result.outcome == core::scroll_outcome::end_reached);
        CHECK(result.gesture_performed);
        CHECK(fixture.capture->get_capture_count() == 2);
      }
    }
  }
}

TEST_CASE("scroll_orchestrator with silence detection ignores positions", "[scroll_orchestrator][silence]")
{
  orchestrator_fixture<core::silence_end_detector> fixture;
  const auto list = core::make_locator("list");
  fixture.orchestrator.begin_session();

  fixture.capture->script(bottom_of_list());
  CHECK(fixture.step(list, core::physical_direction::down).outcome == core::scroll_outcome::continued);

  fixture.capture->script(std::nullopt);
  CHECK(fixture.step(list, core::physical_direction::down).outcome == core::scroll_outcome::end_reached);
  CHECK(fixture.step(list, core::physical_direction::down).outcome == core::scroll_outcome::no_movement);
}

TEST_CASE("scroll_orchestrator uses the axis of the direction", "[scroll_orchestrator][axis]")
{
  orchestrator_fixture<core::index_offset_end_detector> fixture;
  const auto carousel = core::make_locator("carousel");
  fixture.orchestrator.begin_session();

  // Vertical offsets at zero say nothing about horizontal movement.
  fixture.capture->script(
    core::feedback_signal{ .scroll_x = 120, .scroll_y = 0, .max_scroll_x = 300, .max_scroll_y = 0 });
  CHECK(fixture.step(carousel, core::physical_direction::right).outcome == core::scroll_outcome::continued);

  fixture.capture->script(core::feedback_signal{ .scroll_x = 300, .max_scroll_x = 300 });
  CHECK(fixture.step(carousel, core::physical_direction::right).outcome == core::scroll_outcome::end_reached);
}

TEST_CASE("scroll_orchestrator ends the session on unrecoverable failures", "[scroll_orchestrator][errors]")
{
  orchestrator_fixture<core::index_offset_end_detector> fixture;
  const auto list = core::make_locator("list");
  fixture.orchestrator.begin_session();
  fixture.capture->set_failure("device disconnected");

  CHECK_THROWS_AS(fixture.step(list, core::physical_direction::down), core::unrecoverable_error);
  CHECK(fixture.orchestrator.get_state() == decltype(fixture.orchestrator)::state::idle);
  CHECK_THROWS_AS(fixture.step(list, core::physical_direction::down), std::logic_error);
}
