#include <algorithm>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <thread>
#include <variant>

#include <fmt/format.h>

#include <asio/co_spawn.hpp>
#include <asio/post.hpp>

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>

#include <libs/corort/runtime.hpp>

namespace {

// stdout may carry program output so logs go to stderr only
void setup_logger(const std::string& app_name) {
  auto term = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(spdlog::color_mode::automatic);
  auto logger = std::make_shared<spdlog::logger>(app_name, term);
  spdlog::set_default_logger(std::move(logger));
  spdlog::cfg::load_env_levels();
}

} // namespace

int main(int argc, char** argv) {
  setup_logger(std::filesystem::path{argv[0]}.filename().string());

  asio::io_context io;
  asio::static_thread_pool pool{std::max(co::min_threads, std::thread::hardware_concurrency()) - 1};

  std::variant<std::monostate, int, std::exception_ptr> rc;
  asio::co_spawn(
      io, co::main(io.get_executor(), pool.get_executor(), {argv, argv + argc}),
      [&rc](std::exception_ptr err, int ec) {
        if (err)
          rc = std::move(err);
        else
          rc = ec;
      }
  );
  asio::post(pool, [&io, &pool] {
    io.run();
    pool.stop();
  });
  pool.attach();
  pool.wait();

  switch (rc.index()) {
  case 0:
    fmt::print(stderr, "Interrupted\n");
    break;
  case 1:
    return std::get<int>(rc);
  case 2:
    std::rethrow_exception(std::get<std::exception_ptr>(rc));
  }
  return EXIT_FAILURE;
}
