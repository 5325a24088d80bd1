#include <cassert>
#include <utility>

#include "directory.hpp"
#include "zip.hpp"

namespace zipstream {

void directory::add_entry(file_header header, descriptor desc, uint64_t offset) {
  assert(!offset_);
  entries_.push_back({.header = std::move(header), .desc = desc, .offset = offset});
}

bytes directory::finalize(uint64_t offset) && {
  offset_ = offset;
  return serialize();
}

bytes directory::serialize() const {
  assert(offset_ && "directory offset must be set before serialization");

  size_t capacity = zip::record_size::end_of_central_dir;
  for (const auto& e : entries_)
    capacity += zip::record_size::central_file_header + e.header.name.size();

  bytes res;
  res.reserve(capacity);
  for (const auto& e : entries_)
    append_central_file_header(res, e.header, e.desc, e.offset);
  const size_t cd_size = res.size();
  append_end_of_central_dir(res, entries_.size(), cd_size, *offset_);
  return res;
}

} // namespace zipstream
