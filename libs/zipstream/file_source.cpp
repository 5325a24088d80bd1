#include <algorithm>

#include <spdlog/spdlog.h>

#include "file_source.hpp"

namespace zipstream {

namespace {

template <typename Iterator>
std::vector<fs::path> list_regular_files(Iterator it) {
  std::vector<fs::path> res;
  for (const fs::directory_entry& entry : it) {
    if (entry.is_regular_file())
      res.push_back(entry.path());
  }
  std::ranges::sort(res);
  return res;
}

std::vector<source_file> list_directory(const fs::path& root, bool recursive) {
  auto paths = recursive ? list_regular_files(fs::recursive_directory_iterator{root})
                         : list_regular_files(fs::directory_iterator{root});
  spdlog::debug("{} regular files found in {}", paths.size(), root.string());

  std::vector<source_file> res;
  res.reserve(paths.size());
  for (auto& path : paths) {
    std::string name = path.lexically_relative(root).generic_string();
    res.push_back({.path = std::move(path), .name = std::move(name)});
  }
  return res;
}

} // namespace

path_list_source::path_list_source(const std::vector<fs::path>& paths) {
  files_.reserve(paths.size());
  for (const auto& path : paths)
    files_.push_back({.path = path, .name = path.relative_path().generic_string()});
}

std::optional<source_file> path_list_source::next() {
  if (pos_ == files_.size())
    return std::nullopt;
  return std::move(files_[pos_++]);
}

directory_source::directory_source(const fs::path& root, bool recursive)
    : files_{list_directory(root, recursive)} {}

} // namespace zipstream
