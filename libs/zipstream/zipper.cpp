#include <exception>
#include <span>
#include <system_error>
#include <utility>

#include <zlib.h>

#include <spdlog/spdlog.h>

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/use_awaitable.hpp>

#include <util/io.hpp>

#include "directory.hpp"
#include "dos_time.hpp"
#include "entry_name.hpp"
#include "zipper.hpp"

namespace zipstream {

namespace {

class crc32_hasher {
public:
  void update(std::span<const std::byte> data) noexcept {
    crc_ = ::crc32(crc_, reinterpret_cast<const Bytef*>(data.data()), static_cast<uInt>(data.size()));
  }
  uint32_t finalize() const noexcept { return static_cast<uint32_t>(crc_); }

private:
  uLong crc_ = ::crc32(0L, Z_NULL, 0);
};

/// Producer state of a single archive. Owns the output cursor and the
/// directory, both are touched only by the producer coroutine.
class archive_writer {
public:
  archive_writer(chunk_channel& channel, const options& opts) noexcept : channel_{channel}, opts_{opts} {}

  asio::awaitable<void> write(file_source& files) {
    while (auto file = files.next())
      co_await write_entry(*file);

    const size_t entries_count = directory_.entries().size();
    co_await emit(std::move(directory_).finalize(cursor_));
    spdlog::info("Archive with {} entries streamed, {} bytes total", entries_count, cursor_);

    // end of stream marker
    co_await send({}, {});
  }

  asio::awaitable<void> fail(std::error_code ec) {
    auto [send_ec] = co_await channel_.async_send(ec, chunk{}, asio::as_tuple(asio::use_awaitable));
    if (send_ec)
      spdlog::warn("Failed to report archive error to the consumer: {}", send_ec.message());
  }

  bool receiver_gone() const noexcept { return receiver_gone_; }
  uint64_t position() const noexcept { return cursor_; }

private:
  asio::awaitable<void> write_entry(const source_file& file) {
    const auto fd = io::open(file.path, io::mode::read_only);
    file_header header{.name = to_utf8_lossy(file.name), .modified = to_dos_timestamp(io::modification_time(fd))};
    if (header.name != file.name)
      spdlog::warn("{} is not a valid UTF-8 name, stored as {}", file.path.string(), header.name);

    const uint64_t header_offset = cursor_;
    co_await emit(serialize(header));

    const uint64_t content_offset = cursor_;
    crc32_hasher hasher;
    while (true) {
      chunk data(opts_.chunk_size);
      const size_t sz = io::read(fd, data);
      if (sz == 0)
        break;
      data.resize(sz);
      hasher.update(data);
      co_await emit(std::move(data));
    }

    const descriptor desc{.size = cursor_ - content_offset, .crc = hasher.finalize()};
    co_await emit(serialize(desc));
    spdlog::debug(
        "{} archived: offset={} size={} crc32={:08x}", header.name, header_offset, desc.size, desc.crc
    );

    directory_.add_entry(std::move(header), desc, header_offset);
  }

  asio::awaitable<void> emit(chunk data) {
    const size_t sz = data.size();
    co_await send({}, std::move(data));
    cursor_ += sz;
  }

  asio::awaitable<void> send(std::error_code ec, chunk data) {
    auto [send_ec] = co_await channel_.async_send(ec, std::move(data), asio::as_tuple(asio::use_awaitable));
    if (send_ec) {
      receiver_gone_ = true;
      throw std::system_error{send_ec, "zip stream send"};
    }
  }

private:
  chunk_channel& channel_;
  const options opts_;
  uint64_t cursor_ = 0;
  directory directory_;
  bool receiver_gone_ = false;
};

asio::awaitable<void> produce(
    std::unique_ptr<file_source> files, options opts, std::shared_ptr<chunk_channel> channel
) {
  archive_writer writer{*channel, opts};
  std::error_code failure;
  try {
    co_await writer.write(*files);
    co_return;
  } catch (const std::system_error& err) {
    if (writer.receiver_gone()) {
      spdlog::warn("Archive consumer has gone after {} bytes: {}", writer.position(), err.what());
      co_return;
    }
    spdlog::error("Archive streaming aborted after {} bytes: {}", writer.position(), err.what());
    failure = err.code();
  } catch (const std::exception& err) {
    spdlog::error("Archive streaming aborted after {} bytes: {}", writer.position(), err.what());
    failure = std::make_error_code(std::errc::io_error);
  }
  co_await writer.fail(failure);
}

} // namespace

asio::awaitable<std::optional<chunk>> zip_stream::next() {
  if (finished_)
    co_return std::nullopt;
  auto [ec, data] = co_await channel_->async_receive(asio::as_tuple(asio::use_awaitable));
  if (ec) {
    finished_ = true;
    throw std::system_error{ec, "zip stream"};
  }
  if (data.empty()) {
    finished_ = true;
    co_return std::nullopt;
  }
  co_return std::move(data);
}

void zip_stream::close() noexcept {
  if (channel_) {
    // close fails further sends while cancel completes the one producer may
    // be waiting for
    channel_->close();
    channel_->cancel();
  }
  finished_ = true;
}

zipper zipper::from_paths(const std::vector<fs::path>& paths, options opts) {
  return zipper{std::make_unique<path_list_source>(paths), opts};
}

zipper zipper::from_directory(const fs::path& root, bool recursive, options opts) {
  return zipper{std::make_unique<directory_source>(root, recursive), opts};
}

zip_stream zipper::zipped_stream(asio::any_io_executor exec) && {
  auto channel = std::make_shared<chunk_channel>(exec, opts_.channel_capacity);
  asio::co_spawn(exec, produce(std::move(files_), opts_, channel), asio::detached);
  return zip_stream{std::move(channel)};
}

} // namespace zipstream
