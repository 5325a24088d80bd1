#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <ctime>

namespace zipstream {

/// MS-DOS date and time as stored in ZIP records. Seconds are kept with two
/// seconds granularity.
struct dos_timestamp {
  // hour << 11 | minute << 5 | second / 2
  uint16_t time = 0;
  // (year - 1980) << 9 | month << 5 | day
  uint16_t date = 0;

  auto operator<=>(const dos_timestamp&) const = default;
};

dos_timestamp to_dos_timestamp(const std::tm& tm);
// Local time of the host is used as other zip tools do.
dos_timestamp to_dos_timestamp(std::chrono::system_clock::time_point tp);

} // namespace zipstream
