#pragma once

#include <span>
#include <string_view>

// Both functions remove the found arguments from `args`, the first element is
// considered to be the program name and is never touched.
bool get_flag(std::span<char*>& args, std::string_view flag) noexcept;
const char* get_option(std::span<char*>& args, std::string_view option) noexcept;
