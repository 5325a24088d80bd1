#pragma once

#include <string>
#include <string_view>

namespace zipstream {

/// Entry names are flagged as UTF-8 in every record. Each maximal invalid
/// subsequence of `name` is replaced with U+FFFD, valid names are returned
/// unchanged.
std::string to_utf8_lossy(std::string_view name);

} // namespace zipstream
