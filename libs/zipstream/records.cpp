#include <concepts>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "error.hpp"
#include "records.hpp"
#include "zip.hpp"

namespace zipstream {

namespace {

class le_writer {
public:
  explicit le_writer(bytes& out) noexcept : out_{out} {}

  template <std::unsigned_integral T>
  le_writer& put(T val) {
    for (size_t i = 0; i < sizeof(T); ++i)
      out_.push_back(static_cast<std::byte>(val >> (8 * i)));
    return *this;
  }

  le_writer& put(std::string_view str) {
    const auto data = std::as_bytes(std::span{str});
    out_.insert(out_.end(), data.begin(), data.end());
    return *this;
  }

private:
  bytes& out_;
};

uint16_t name_size(const std::string& name) {
  if (name.size() > zip::max_name_size)
    throw std::system_error{make_error_code(errc::name_too_long), name.substr(0, 64) + "..."};
  return static_cast<uint16_t>(name.size());
}

uint32_t file_size(uint64_t size) {
  if (size > zip::max_size)
    throw std::system_error{make_error_code(errc::file_too_big), std::to_string(size) + " bytes"};
  return static_cast<uint32_t>(size);
}

uint32_t archive_offset(uint64_t offset) {
  if (offset > zip::max_size)
    throw std::system_error{make_error_code(errc::archive_too_big), "offset " + std::to_string(offset)};
  return static_cast<uint32_t>(offset);
}

} // namespace

bytes serialize(const file_header& header) {
  const uint16_t fname_size = name_size(header.name);

  bytes res;
  res.reserve(zip::record_size::local_file_header + fname_size);
  le_writer{res}
      .put(zip::signature::local_file_header)
      .put(zip::version_needed)
      .put(zip::gp_bits)
      .put(std::to_underlying(zip::compression::stored))
      .put(header.modified.time)
      .put(header.modified.date)
      // crc-32, compressed size and uncompressed size are in the descriptor
      .put(uint32_t{0})
      .put(uint32_t{0})
      .put(uint32_t{0})
      .put(fname_size)
      // extra field length
      .put(uint16_t{0})
      .put(header.name);
  return res;
}

bytes serialize(const descriptor& desc) {
  const uint32_t size = file_size(desc.size);

  bytes res;
  res.reserve(zip::record_size::data_descriptor);
  le_writer{res}
      .put(zip::signature::data_descriptor)
      .put(desc.crc)
      // compressed and uncompressed sizes are equal for stored files
      .put(size)
      .put(size);
  return res;
}

void append_central_file_header(
    bytes& out, const file_header& header, const descriptor& desc, uint64_t local_header_offset
) {
  const uint16_t fname_size = name_size(header.name);
  const uint32_t size = file_size(desc.size);
  const uint32_t offset = archive_offset(local_header_offset);

  le_writer{out}
      .put(zip::signature::central_file_header)
      .put(zip::version_made_by)
      .put(zip::version_needed)
      .put(zip::gp_bits)
      .put(std::to_underlying(zip::compression::stored))
      .put(header.modified.time)
      .put(header.modified.date)
      .put(desc.crc)
      .put(size)
      .put(size)
      .put(fname_size)
      // extra field length, file comment length, disk number start and
      // internal file attributes
      .put(uint16_t{0})
      .put(uint16_t{0})
      .put(uint16_t{0})
      .put(uint16_t{0})
      // external file attributes
      .put(uint32_t{0})
      .put(offset)
      .put(header.name);
}

void append_end_of_central_dir(bytes& out, size_t entries_count, uint64_t cd_size, uint64_t cd_offset) {
  if (entries_count > zip::max_entries_count)
    throw std::system_error{
        make_error_code(errc::archive_too_big), std::to_string(entries_count) + " entries"
    };
  const auto count = static_cast<uint16_t>(entries_count);
  const uint32_t size = archive_offset(cd_size);
  const uint32_t offset = archive_offset(cd_offset);

  le_writer{out}
      .put(zip::signature::end_of_central_dir)
      // number of this disk and disk with the central directory
      .put(uint16_t{0})
      .put(uint16_t{0})
      // entries on this disk and total entries
      .put(count)
      .put(count)
      .put(size)
      .put(offset)
      // .ZIP file comment length
      .put(uint16_t{0});
}

} // namespace zipstream
