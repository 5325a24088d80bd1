#pragma once

#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

/// Reads back stored archives produced by the streaming writer. Only the
/// subset written by zipstream is supported: no zip64, no comments and no
/// compression. Relies on little endian host.
namespace testing::zip {

namespace detail {

class span_reader {
public:
  explicit span_reader(std::span<const std::byte> data) noexcept : data_{data} {}

  template <typename T>
    requires std::is_trivially_copyable_v<T>
  T read() {
    T res;
    std::memcpy(&res, take(sizeof(T)).data(), sizeof(T));
    return res;
  }

  std::string read_string(size_t size) {
    const auto data = take(size);
    return std::string{reinterpret_cast<const char*>(data.data()), data.size()};
  }

  std::span<const std::byte> take(size_t size) {
    if (size > data_.size())
      throw std::runtime_error{"unexpected end of archive"};
    auto res = data_.first(size);
    data_ = data_.subspan(size);
    return res;
  }

private:
  std::span<const std::byte> data_;
};

#pragma pack(push, 1)

struct end_of_cd_record {
  static constexpr uint32_t valid_signature = 0x06054b50;

  uint32_t signature;
  uint16_t disk_num;
  uint16_t cd_start_disk_num;
  uint16_t this_disk_entries_count;
  uint16_t total_entries_count;
  uint32_t cd_size;
  uint32_t cd_offset;
  uint16_t comment_size;
};
static_assert(sizeof(end_of_cd_record) == 22);

struct cd_file_header {
  static constexpr uint32_t valid_signature = 0x02014b50;

  uint32_t signature;
  uint16_t version_made_by;
  uint16_t version_needed_to_extract;
  uint16_t gp_bits;
  uint16_t compression_method;
  uint16_t modtime;
  uint16_t moddate;
  uint32_t crc32;
  uint32_t compressed_size;
  uint32_t raw_size;
  uint16_t fname_size;
  uint16_t extrafield_size;
  uint16_t file_comment_size;
  uint16_t disk_num_start;
  uint16_t internal_attrs;
  uint32_t external_attrs;
  uint32_t local_header_offset;
};
static_assert(sizeof(cd_file_header) == 46);

struct local_file_header {
  static constexpr uint32_t valid_signature = 0x04034b50;

  uint32_t signature;
  uint16_t version_needed_to_extract;
  uint16_t gp_bits;
  uint16_t compression_method;
  uint16_t modtime;
  uint16_t moddate;
  uint32_t crc32;
  uint32_t compressed_size;
  uint32_t raw_size;
  uint16_t fname_size;
  uint16_t extra_field_size;
};
static_assert(sizeof(local_file_header) == 30);

struct data_descriptor {
  static constexpr uint32_t valid_signature = 0x08074b50;

  uint32_t signature;
  uint32_t crc32;
  uint32_t compressed_size;
  uint32_t raw_size;
};
static_assert(sizeof(data_descriptor) == 16);

#pragma pack(pop)

} // namespace detail

struct entry {
  std::string name;
  uint16_t modtime = 0;
  uint16_t moddate = 0;
  uint16_t gp_bits = 0;
  uint32_t crc32 = 0;
  uint32_t size = 0;
  uint32_t local_header_offset = 0;
  std::vector<std::byte> content;
  // Values of the data descriptor following the content
  uint32_t descriptor_crc32 = 0;
  uint32_t descriptor_size = 0;
};

struct archive {
  std::vector<entry> entries;
  uint32_t cd_offset = 0;
  uint32_t cd_size = 0;
};

inline archive read(std::span<const std::byte> data) {
  using namespace detail;

  if (data.size() < sizeof(end_of_cd_record))
    throw std::runtime_error{"archive is too small"};
  const auto cd_end = span_reader{data.last(sizeof(end_of_cd_record))}.read<end_of_cd_record>();
  if (cd_end.signature != end_of_cd_record::valid_signature)
    throw std::runtime_error{"can't locate end of central directory record"};
  if (cd_end.disk_num != 0 || cd_end.cd_start_disk_num != 0)
    throw std::runtime_error{"multi disk ZIP archives are not supported"};
  if (cd_end.this_disk_entries_count != cd_end.total_entries_count)
    throw std::runtime_error{"entries count mismatch"};
  if (static_cast<size_t>(cd_end.cd_offset) + cd_end.cd_size + sizeof(end_of_cd_record) != data.size())
    throw std::runtime_error{"central directory is not followed by the end record"};

  archive res{.cd_offset = cd_end.cd_offset, .cd_size = cd_end.cd_size};
  span_reader cd{data.subspan(cd_end.cd_offset, cd_end.cd_size)};
  for (int i = 0; i < cd_end.total_entries_count; ++i) {
    const auto rec = cd.read<cd_file_header>();
    if (rec.signature != cd_file_header::valid_signature)
      throw std::runtime_error{"bad central directory file header signature"};
    if (rec.compression_method != 0)
      throw std::runtime_error{"compressed entries are not supported"};
    if (rec.compressed_size != rec.raw_size)
      throw std::runtime_error{"stored entry sizes mismatch"};

    entry e{
        .name = cd.read_string(rec.fname_size),
        .modtime = rec.modtime,
        .moddate = rec.moddate,
        .gp_bits = rec.gp_bits,
        .crc32 = rec.crc32,
        .size = rec.raw_size,
        .local_header_offset = rec.local_header_offset,
    };
    cd.take(rec.extrafield_size + rec.file_comment_size);

    span_reader local{data.subspan(rec.local_header_offset)};
    const auto hdr = local.read<local_file_header>();
    if (hdr.signature != local_file_header::valid_signature)
      throw std::runtime_error{"bad local file header signature"};
    if (local.read_string(hdr.fname_size) != e.name)
      throw std::runtime_error{"local header name differs from central directory"};
    local.take(hdr.extra_field_size);
    const auto content = local.take(e.size);
    e.content.assign(content.begin(), content.end());

    const auto desc = local.read<data_descriptor>();
    if (desc.signature != data_descriptor::valid_signature)
      throw std::runtime_error{"bad data descriptor signature"};
    e.descriptor_crc32 = desc.crc32;
    e.descriptor_size = desc.raw_size;

    res.entries.push_back(std::move(e));
  }
  return res;
}

} // namespace testing::zip
