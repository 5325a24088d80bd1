#include <unistd.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

#include <asio/awaitable.hpp>

#include <libs/cli/struct_args.hpp>
#include <libs/corort/runtime.hpp>
#include <libs/zipstream/zipper.hpp>

#include <util/io.hpp>

namespace {

struct opts {
  const char* output = args::option<const char*>{"-o", "--output",
      "Archive path. Archive is written to standard output if nothing is "
      "specified."}
                           .default_value(nullptr);
  size_t chunk_size =
      args::option<size_t>{"--chunk-size", "Size of a single file read in bytes."}.default_value(8 * 1024);
  bool recursive = args::flag{"-r", "--recursive", "Include files from subdirectories of listed directory."};
};

void print_help(const char* progname) {
  args::usage<opts>(progname, std::cout);
  std::cout << "Inputs: DIR | FILE...\n\n";
  args::args_help<opts>(std::cout);
}

zipstream::zipper make_zipper(std::span<char*> inputs, const opts& opt) {
  const zipstream::options zip_opts{.chunk_size = opt.chunk_size};
  if (inputs.size() == 1 && fs::is_directory(inputs.front()))
    return zipstream::zipper::from_directory(inputs.front(), opt.recursive, zip_opts);
  return zipstream::zipper::from_paths(std::vector<fs::path>(inputs.begin(), inputs.end()), zip_opts);
}

} // namespace

namespace co {

unsigned min_threads = 2;

asio::awaitable<int> main(io_executor, pool_executor pool_exec, std::span<char*> args) {
  if (get_flag(args, "-h")) {
    print_help(args[0]);
    co_return EXIT_SUCCESS;
  }

  std::optional<opts> opt;
  try {
    opt = args::parse<opts>(args);
  } catch (const std::invalid_argument& err) {
    spdlog::error("{}", err.what());
  }
  const auto inputs = args.subspan(1);
  if (!opt || opt->chunk_size == 0 || inputs.empty()) {
    print_help(args[0]);
    co_return EXIT_FAILURE;
  }

  std::optional<io::transactional_file> archive_file;
  io::file_descriptor stdout_fd;
  try {
    auto stream = make_zipper(inputs, *opt).zipped_stream(pool_exec);
    if (opt->output)
      archive_file.emplace(opt->output, io::mode::write_only);
    else
      stdout_fd = io::duplicate(STDOUT_FILENO);
    const io::file_descriptor& out = archive_file ? *archive_file : stdout_fd;

    while (auto data = co_await stream.next())
      io::write(out, *data);
    if (archive_file)
      archive_file->commit();
  } catch (const std::system_error& err) {
    spdlog::error("Failed to build archive: {}", err.what());
    co_return EXIT_FAILURE;
  }

  co_return EXIT_SUCCESS;
}

} // namespace co
