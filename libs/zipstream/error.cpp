#include <string>

#include "error.hpp"

namespace zipstream {

const std::error_category& error_category() noexcept {
  static const struct final : std::error_category {
    const char* name() const noexcept override { return "zipstream"; }
    std::string message(int cond) const override {
      switch (static_cast<errc>(cond)) {
      case errc::name_too_long:
        return "File name is longer than 65535 bytes";
      case errc::file_too_big:
        return "File size does not fit into 32 bits";
      case errc::archive_too_big:
        return "Archive does not fit into 32 bit offsets";
      case errc::timestamp_out_of_range:
        return "Modification time can't be represented as DOS date";
      }
      return "unknown zipstream error " + std::to_string(cond);
    }
  } instance;
  return instance;
}

} // namespace zipstream
