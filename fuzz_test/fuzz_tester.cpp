#include <algorithm>
#include <array>
#include <core/direction.hpp>
#include <core/end_detector.hpp>
#include <core/feedback.hpp>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <driver/report.hpp>
#include <optional>
#include <tuple>

// Fuzzer that feeds arbitrary feedback signals to both end detection strategies
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  using namespace scroll_driver;

  constexpr std::size_t field_count = 7;
  std::array<int, field_count> fields{};
  fields.fill(core::unset_field);
  std::memcpy(fields.data(), Data, std::min(Size, sizeof(fields)));

  const core::feedback_signal signal{ .from_index = fields[0],
    .to_index = fields[1],
    .item_count = fields[2],
    .scroll_x = fields[3],
    .scroll_y = fields[4],
    .max_scroll_x = fields[5],
    .max_scroll_y = fields[6] };

  for (const auto direction : { core::physical_direction::up,
         core::physical_direction::down,
         core::physical_direction::left,
         core::physical_direction::right }) {
    const auto axis = core::standard_direction_converter::axis_of(direction);
    std::ignore = core::index_offset_end_detector{}.detect_end(signal, axis);
    std::ignore = core::silence_end_detector{}.detect_end(signal, axis);
  }

  std::ignore = core::describe(signal);
  std::ignore = driver::signal_to_json(signal).dump();

  return 0;
}
