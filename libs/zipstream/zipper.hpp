#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/experimental/concurrent_channel.hpp>

#include <libs/zipstream/file_source.hpp>
#include <libs/zipstream/records.hpp>

namespace zipstream {

struct options {
  // Size of the buffer file content is read with
  size_t chunk_size = 8 * 1024;
  // Number of chunks buffered before the producer waits for the consumer
  size_t channel_capacity = 64;
};

using chunk = bytes;
// Empty chunk with no error marks the end of the archive. All the other
// chunks are never empty.
using chunk_channel = asio::experimental::concurrent_channel<void(asio::error_code, chunk)>;

/// Consumer side of the archive stream. Chunks concatenated in the order they
/// are received form the complete archive.
class zip_stream {
public:
  explicit zip_stream(std::shared_ptr<chunk_channel> channel) noexcept : channel_{std::move(channel)} {}
  zip_stream(zip_stream&& rhs) noexcept
      : channel_{std::move(rhs.channel_)}, finished_{std::exchange(rhs.finished_, true)} {}
  zip_stream& operator=(zip_stream&& rhs) noexcept {
    close();
    channel_ = std::move(rhs.channel_);
    finished_ = std::exchange(rhs.finished_, true);
    return *this;
  }
  ~zip_stream() noexcept { close(); }

  /// Returns the next chunk or nullopt once the archive is complete. Throws
  /// std::system_error with the cause if the archive could not be built, the
  /// data received so far is not a valid archive in this case.
  asio::awaitable<std::optional<chunk>> next();

  // Stops the producer, no more chunks are delivered
  void close() noexcept;

private:
  std::shared_ptr<chunk_channel> channel_;
  bool finished_ = false;
};

/// Builds stored ZIP archive from a sequence of files in a single pass without
/// seeking over the output.
class zipper {
public:
  explicit zipper(std::unique_ptr<file_source> files, options opts = {}) noexcept
      : files_{std::move(files)}, opts_{opts} {}

  static zipper from_paths(const std::vector<fs::path>& paths, options opts = {});
  static zipper from_directory(const fs::path& root, bool recursive = false, options opts = {});

  /// Spawns the producer task on `exec`. File content is read with blocking
  /// calls so thread pool executor is expected.
  zip_stream zipped_stream(asio::any_io_executor exec) &&;

private:
  std::unique_ptr<file_source> files_;
  options opts_;
};

} // namespace zipstream
