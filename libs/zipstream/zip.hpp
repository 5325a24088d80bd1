#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

/// Subset of https://pkware.cachefly.net/webdocs/casestudies/APPNOTE.TXT
/// required to write stored (uncompressed) archives in a single pass.
namespace zipstream::zip {

namespace signature {

constexpr uint32_t local_file_header = 0x04034b50;
constexpr uint32_t data_descriptor = 0x08074b50;
constexpr uint32_t central_file_header = 0x02014b50;
constexpr uint32_t end_of_central_dir = 0x06054b50;

} // namespace signature

namespace record_size {

constexpr size_t local_file_header = 30;
constexpr size_t data_descriptor = 16;
constexpr size_t central_file_header = 46;
constexpr size_t end_of_central_dir = 22;

} // namespace record_size

enum class compression : uint16_t {
  stored = 0, // The file is stored (no compression)
};

enum gp_flag : uint16_t {
  // crc-32, compressed size and uncompressed size are set to zero in the local
  // header and the correct values are put in the data descriptor
  use_data_descriptor = 1 << 3,
  // filename is encoded using UTF-8
  language_encoding = 1 << 11,
};

// 2.0: files stored with the data descriptor
constexpr uint16_t version_needed = 20;
constexpr uint16_t version_made_by = version_needed;
constexpr uint16_t gp_bits = use_data_descriptor | language_encoding;

constexpr uint64_t max_size = std::numeric_limits<uint32_t>::max();
constexpr size_t max_name_size = std::numeric_limits<uint16_t>::max();
constexpr size_t max_entries_count = std::numeric_limits<uint16_t>::max();

} // namespace zipstream::zip
