#pragma once

#include "execution-broker.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <cassert>
#include <optional>
#include <thread>
#include <vector>

namespace courier::async {

/**
 * @brief A pool of threads running one `boost::asio::io_context`.
 *
 * The broker, the rpc clients and servers, and the request handlers all post their
 * work here. A work guard keeps the threads alive until `stop()`.
 */
class AsioExecutionContext {
private:
  using WorkGuardType = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

  boost::asio::io_context& io_context_;
  std::size_t size_;
  std::optional<WorkGuardType> work_guard_;
  std::vector<std::thread> pool_;

public:
  AsioExecutionContext(boost::asio::io_context& io_context, std::size_t thread_pool_size = 0)
      : io_context_{io_context}, size_{thread_pool_size == 0 ? std::thread::hardware_concurrency()
                                                             : thread_pool_size} {
    if (size_ == 0)
      size_ = 1;
    pool_.reserve(size_);
  }

  AsioExecutionContext(const AsioExecutionContext&) = delete;
  AsioExecutionContext& operator=(const AsioExecutionContext&) = delete;

  ~AsioExecutionContext() { stop(); }

  /** @brief Run the pool */
  void run() {
    assert(!is_running());
    work_guard_.emplace(io_context_.get_executor());
    for (std::size_t i = 0; i < size_; ++i)
      pool_.emplace_back([this]() { io_context_.run(); });
  }

  /** @brief Let the pool drain outstanding work, then join the threads */
  void stop() {
    work_guard_.reset();
    for (auto& thread : pool_)
      if (thread.joinable())
        thread.join();
    pool_.clear();
  }

  /** @brief true iff the execution context is running */
  bool is_running() const noexcept { return pool_.size() > 0; }

  /** @brief Number of threads executing io requests in parallel */
  std::size_t size() const noexcept { return size_; }

  /** @brief Return an execution broker for running jobs on the pool */
  IoContextBroker get_execution_broker() const { return IoContextBroker{io_context_.get_executor()}; }

  /** @brief Direct access to the underlying io_context */
  boost::asio::io_context& io_context() { return io_context_; }
};

} // namespace courier::async
