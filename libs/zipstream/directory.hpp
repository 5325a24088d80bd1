#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <libs/zipstream/records.hpp>

namespace zipstream {

/// Central directory collected while the archive is streamed.
class directory {
public:
  struct entry {
    file_header header;
    descriptor desc;
    // Position of the local file header in the output stream
    uint64_t offset = 0;
  };

  // Entries must be added in the order files are written to the stream
  void add_entry(file_header header, descriptor desc, uint64_t offset);

  const std::vector<entry>& entries() const noexcept { return entries_; }

  /// Serializes all entries followed by the end of central directory record.
  /// `offset` is the stream position the directory is written at.
  bytes finalize(uint64_t offset) &&;

private:
  bytes serialize() const;

private:
  std::vector<entry> entries_;
  std::optional<uint64_t> offset_;
};

} // namespace zipstream
