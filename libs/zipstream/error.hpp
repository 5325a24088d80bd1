#pragma once

#include <system_error>

namespace zipstream {

enum class errc : int {
  name_too_long = 1,
  file_too_big,
  archive_too_big,
  timestamp_out_of_range,
};

const std::error_category& error_category() noexcept;

inline std::error_code make_error_code(errc c) noexcept { return {static_cast<int>(c), error_category()}; }

} // namespace zipstream

namespace std {
template <>
struct is_error_code_enum<zipstream::errc> : std::true_type {};
} // namespace std
