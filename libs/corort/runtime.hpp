#pragma once

#include <span>

#include <asio/awaitable.hpp>
#include <asio/io_context.hpp>
#include <asio/static_thread_pool.hpp>

namespace co {

using pool_executor = asio::thread_pool::executor_type;
using io_executor = asio::io_context::executor_type;

// Application entry point provided by every executable linked with corort.
// Blocking work has to be scheduled to pool_exec.
extern asio::awaitable<int> main(io_executor io_exec, pool_executor pool_exec, std::span<char*> args);
// Minimal number of threads in the pool including the main thread.
extern unsigned min_threads;

} // namespace co
