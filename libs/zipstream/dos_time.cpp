#include <system_error>

#include "dos_time.hpp"
#include "error.hpp"

namespace zipstream {

namespace {

constexpr int dos_epoch_year = 1980;
constexpr int dos_last_year = dos_epoch_year + 0x7f;
constexpr int tm_base_year = 1900;

} // namespace

dos_timestamp to_dos_timestamp(const std::tm& tm) {
  const int year = tm.tm_year + tm_base_year;
  if (year < dos_epoch_year || year > dos_last_year)
    throw std::system_error{make_error_code(errc::timestamp_out_of_range), "dos date"};
  return {
      .time = static_cast<uint16_t>(tm.tm_hour << 11 | tm.tm_min << 5 | tm.tm_sec / 2),
      .date = static_cast<uint16_t>((year - dos_epoch_year) << 9 | (tm.tm_mon + 1) << 5 | tm.tm_mday),
  };
}

dos_timestamp to_dos_timestamp(std::chrono::system_clock::time_point tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm;
  if (::localtime_r(&t, &tm) == nullptr)
    throw std::system_error{make_error_code(errc::timestamp_out_of_range), "localtime"};
  return to_dos_timestamp(tm);
}

} // namespace zipstream
