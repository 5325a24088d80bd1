#pragma once

#include <memory>
#include <utility>

#include <asio/awaitable.hpp>
#include <asio/co_spawn.hpp>
#include <asio/static_thread_pool.hpp>
#include <asio/use_future.hpp>

#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>

class executors_environment : public Catch::EventListenerBase {
public:
  using Catch::EventListenerBase::EventListenerBase;

  void testRunStarting(const Catch::TestRunInfo&) override;
  void testRunEnded(const Catch::TestRunStats&) override;

  static asio::static_thread_pool::executor_type pool_executor();

  // Runs coroutine on the pool and blocks until it is finished. Exceptions
  // thrown by the coroutine are rethrown.
  template <typename T>
  static T run(asio::awaitable<T> task) {
    return asio::co_spawn(pool_executor(), std::move(task), asio::use_future).get();
  }

private:
  struct environment_data;

  static std::unique_ptr<environment_data> environment_data_instance;
};
