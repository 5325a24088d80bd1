#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <libs/zipstream/dos_time.hpp>

namespace zipstream {

using bytes = std::vector<std::byte>;

struct file_header {
  std::string name;
  dos_timestamp modified;
};

struct descriptor {
  uint64_t size = 0;
  uint32_t crc = 0;
};

/// Local file header with crc-32 and sizes left zero. Real values are
/// delivered by the data descriptor following the file content.
bytes serialize(const file_header& header);
bytes serialize(const descriptor& desc);

void append_central_file_header(
    bytes& out, const file_header& header, const descriptor& desc, uint64_t local_header_offset
);
void append_end_of_central_dir(bytes& out, size_t entries_count, uint64_t cd_size, uint64_t cd_offset);

} // namespace zipstream
