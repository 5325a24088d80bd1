#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace zipstream {

struct source_file {
  // Location of the file to read content from
  fs::path path;
  // Entry name inside the archive
  std::string name;
};

/// Sequence of files to put into an archive, its length is not known in
/// advance.
class file_source {
public:
  virtual ~file_source() noexcept = default;

  virtual std::optional<source_file> next() = 0;
};

class path_list_source final : public file_source {
public:
  explicit path_list_source(std::vector<source_file> files) noexcept : files_{std::move(files)} {}
  // Entry names are paths without root in generic format
  explicit path_list_source(const std::vector<fs::path>& paths);

  std::optional<source_file> next() override;

private:
  std::vector<source_file> files_;
  size_t pos_ = 0;
};

/// Regular files of a directory sorted by path. Entry names are relative to
/// the directory root.
class directory_source final : public file_source {
public:
  explicit directory_source(const fs::path& root, bool recursive = false);

  std::optional<source_file> next() override { return files_.next(); }

private:
  path_list_source files_;
};

} // namespace zipstream
