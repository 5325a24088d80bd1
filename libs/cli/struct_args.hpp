#pragma once

#include <charconv>
#include <optional>
#include <ostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <libs/cli/get_option.hpp>

namespace args {

namespace detail {

struct option_info {
  std::string_view long_name;
  std::string_view short_name;
  std::string_view description;
};

struct parser_iface {
  virtual const char* get_option(const option_info& opt) = 0;
  virtual const char* get_required_option(const option_info& opt) = 0;
  virtual bool get_flag(const option_info& opt) = 0;
};

inline parser_iface* current_parser = nullptr;

// Options found are removed from args, positional arguments stay there.
class arguments_parser : public parser_iface {
public:
  arguments_parser(std::span<char*>& args) : args_{args} {}

  const char* get_option(const option_info& opt) override {
    const char* val = ::get_option(args_, opt.long_name);
    if (!val && !opt.short_name.empty())
      val = ::get_option(args_, opt.short_name);
    return val;
  }

  const char* get_required_option(const option_info& opt) override {
    const char* val = get_option(opt);
    if (!val)
      missing_opts_.push_back(opt.long_name);
    return val;
  }

  bool get_flag(const option_info& opt) override {
    const bool long_set = ::get_flag(args_, opt.long_name);
    const bool short_set = !opt.short_name.empty() && ::get_flag(args_, opt.short_name);
    return long_set || short_set;
  }

  void check() const {
    if (missing_opts_.empty())
      return;
    std::string msg = "missing required options:";
    for (auto opt : missing_opts_)
      (msg += ' ') += opt;
    throw std::invalid_argument{msg};
  }

private:
  std::span<char*>& args_;
  std::vector<std::string_view> missing_opts_;
};

class args_help_parser : public parser_iface {
public:
  args_help_parser(std::ostream& out) noexcept : out_{out} {}

  const char* get_option(const option_info& opt) override {
    describe(opt, " VAL");
    return nullptr;
  }

  const char* get_required_option(const option_info& opt) override { return get_option(opt); }

  bool get_flag(const option_info& opt) override {
    describe(opt, "");
    return false;
  }

private:
  void describe(const option_info& opt, std::string_view val) {
    out_ << '\t' << opt.long_name << (opt.short_name.empty() ? "" : ", ") << opt.short_name << val << '\t'
         << opt.description << '\n';
  }

private:
  std::ostream& out_;
};

class usage_parser : public parser_iface {
public:
  usage_parser(std::ostream& out) noexcept : out_{out} {}

  const char* get_option(const option_info& opt) override {
    out_ << " [" << short_or_long(opt) << " VAL]";
    return nullptr;
  }
  const char* get_required_option(const option_info& opt) override {
    out_ << ' ' << short_or_long(opt) << " VAL";
    return nullptr;
  }
  bool get_flag(const option_info& opt) override {
    out_ << " [" << short_or_long(opt) << ']';
    return false;
  }

private:
  static std::string_view short_or_long(const option_info& opt) noexcept {
    return opt.short_name.empty() ? opt.long_name : opt.short_name;
  }

private:
  std::ostream& out_;
};

template <typename T>
T from_string(const char* val) {
  if constexpr (std::is_arithmetic_v<T>) {
    const std::string_view str{val};
    T res{};
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), res);
    if (ec != std::errc{} || ptr != str.data() + str.size())
      throw std::invalid_argument{"bad numeric option value: " + std::string{str}};
    return res;
  } else {
    return T{val};
  }
}

} // namespace detail

template <typename T>
class option : private detail::option_info {
public:
  option(const char* long_name, const char* description)
      : detail::option_info{.long_name = long_name, .short_name = {}, .description = description} {}

  option(const char* short_name, const char* long_name, const char* description)
      : detail::option_info{.long_name = long_name, .short_name = short_name, .description = description} {}

  option& default_value(const T& val) {
    default_ = val;
    return *this;
  }

  operator T() const {
    const char* val =
        default_ ? detail::current_parser->get_option(*this) : detail::current_parser->get_required_option(*this);
    return val ? detail::from_string<T>(val) : default_.value_or(T{});
  }

private:
  std::optional<T> default_;
};

class flag : private detail::option_info {
public:
  flag(const char* short_name, const char* long_name, const char* description)
      : detail::option_info{.long_name = long_name, .short_name = short_name, .description = description} {}

  operator bool() const { return detail::current_parser->get_flag(*this); }
};

/// Parses options into T and strips them from args leaving positional
/// arguments only. Throws std::invalid_argument if some required options are
/// missing.
template <typename T>
T parse(std::span<char*>& args) {
  detail::arguments_parser p{args};
  detail::current_parser = &p;
  T res{};
  p.check();
  return res;
}

template <typename T>
void args_help(std::ostream& out) {
  detail::args_help_parser p{out};
  detail::current_parser = &p;
  T{};
}

template <typename T>
void usage(std::string_view progname, std::ostream& out) {
  out << "Usage: " << progname;
  detail::usage_parser p{out};
  detail::current_parser = &p;
  T{};
  out << '\n';
}

} // namespace args
