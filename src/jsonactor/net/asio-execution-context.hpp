#pragma once

#include "jsonactor/utils.hpp"

#include <boost/asio/io_context.hpp>

#include <memory>
#include <thread>
#include <vector>

namespace jsonactor::net {

/**
 * @brief A pool of threads that all run the same `boost::asio::io_context`.
 *
 * Connection handlers are serialized per connection with strands, so any number of
 * threads may drive the one io_context. The threads return when the io_context is
 * stopped or runs out of work; the destructor joins them.
 */
class AsioExecutionContext {
private:
  boost::asio::io_context& io_context_;
  std::size_t size_;
  std::vector<std::thread> pool_;

public:
  using ExecutorType = boost::asio::io_context::executor_type;

  AsioExecutionContext(boost::asio::io_context& io_context, std::size_t thread_pool_size = 0)
      : io_context_{io_context},
        size_{thread_pool_size == 0 ? std::max(1u, std::thread::hardware_concurrency())
                                    : thread_pool_size} {
    pool_.reserve(size_);
  }

  AsioExecutionContext(const AsioExecutionContext&) = delete;
  AsioExecutionContext& operator=(const AsioExecutionContext&) = delete;

  ~AsioExecutionContext() { join(); }

  /** @brief Run the pool */
  void run() {
    Expects(!is_running());
    for (std::size_t i = 0; i < size_; ++i)
      pool_.emplace_back([this]() { io_context_.run(); });
  }

  /** @brief Block until every thread in the pool has returned */
  void join() {
    for (auto& thread : pool_)
      if (thread.joinable())
        thread.join();
  }

  /** @brief true iff the execution context is running */
  bool is_running() const noexcept { return pool_.size() > 0; }

  /** @brief Number of threads executing io requests in parallel */
  std::size_t size() const noexcept { return size_; }

  ExecutorType get_executor() const { return io_context_.get_executor(); }
};

} // namespace jsonactor::net
