#include <ctime>
#include <system_error>

#include <catch2/catch_test_macros.hpp>

#include "dos_time.hpp"
#include "error.hpp"

namespace {

std::tm make_tm(int year, int month, int day, int hour, int min, int sec) {
  std::tm res{};
  res.tm_year = year - 1900;
  res.tm_mon = month - 1;
  res.tm_mday = day;
  res.tm_hour = hour;
  res.tm_min = min;
  res.tm_sec = sec;
  res.tm_isdst = -1;
  return res;
}

} // namespace

SCENARIO("DOS timestamp conversion") {
  GIVEN("some date inside DOS range") {
    const auto tm = make_tm(2021, 6, 15, 13, 37, 42);

    THEN("date and time fields are packed") {
      const auto ts = zipstream::to_dos_timestamp(tm);
      CHECK(ts.date == ((41 << 9) | (6 << 5) | 15));
      CHECK(ts.time == ((13 << 11) | (37 << 5) | 21));
    }
  }

  GIVEN("odd number of seconds") {
    const auto tm = make_tm(2021, 6, 15, 13, 37, 43);

    THEN("seconds are rounded down to two seconds granularity") {
      CHECK(zipstream::to_dos_timestamp(tm) == zipstream::to_dos_timestamp(make_tm(2021, 6, 15, 13, 37, 42)));
    }
  }

  GIVEN("DOS epoch") {
    const auto tm = make_tm(1980, 1, 1, 0, 0, 0);

    THEN("year is encoded as zero") {
      CHECK(zipstream::to_dos_timestamp(tm) == zipstream::dos_timestamp{.time = 0, .date = (1 << 5) | 1});
    }
  }

  GIVEN("the last representable moment") {
    const auto tm = make_tm(2107, 12, 31, 23, 59, 59);

    THEN("all fields are at their max values") {
      CHECK(
          zipstream::to_dos_timestamp(tm) ==
          zipstream::dos_timestamp{.time = (23 << 11) | (59 << 5) | 29, .date = (127 << 9) | (12 << 5) | 31}
      );
    }
  }

  GIVEN("date before DOS epoch") {
    const auto tm = make_tm(1979, 12, 31, 23, 59, 59);

    THEN("conversion fails") {
      CHECK_THROWS_AS(zipstream::to_dos_timestamp(tm), std::system_error);
    }
  }

  GIVEN("date after the year 2107") {
    const auto tm = make_tm(2108, 1, 1, 0, 0, 0);

    THEN("conversion fails") {
      CHECK_THROWS_AS(zipstream::to_dos_timestamp(tm), std::system_error);
    }
  }

  GIVEN("system clock time point") {
    auto tm = make_tm(2001, 9, 9, 4, 46, 40);
    const auto tp = std::chrono::system_clock::from_time_t(std::mktime(&tm));

    THEN("it is converted as local time") { CHECK(zipstream::to_dos_timestamp(tp) == zipstream::to_dos_timestamp(tm)); }
  }
}
