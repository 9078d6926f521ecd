#pragma once

#include "transport.hpp"

#include <boost/asio/io_context.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace courier::mq {

namespace detail {
  struct LoopbackState;
}

/**
 * @brief An in-process message broker.
 *
 * Supports `direct` and `fanout` exchanges, the default exchange (which routes to the
 * queue named by the routing key), `amq.direct` and `amq.fanout`. Queues hold a backlog
 * until consumed; consumers of a queue take turns. Deliveries must be acknowledged, and
 * a channel's prefetch limits how many may be unacknowledged at once.
 *
 * `mandatory` messages that reach no queue are returned with `312 NO_ROUTE`;
 * `immediate` messages that reach no consumer are returned with `313 NO_CONSUMERS`.
 * Exclusive queues are deleted with their channel, and autodelete queues when their last
 * consumer goes away.
 *
 * All listener callbacks are posted to the io_context.
 */
class LoopbackBroker {
private:
  std::shared_ptr<detail::LoopbackState> state_;

public:
  explicit LoopbackBroker(boost::asio::io_context& io_context);
  LoopbackBroker(const LoopbackBroker&) = delete;
  LoopbackBroker& operator=(const LoopbackBroker&) = delete;
  ~LoopbackBroker();

  /** @brief A new channel; it connects when opened */
  std::shared_ptr<Transport> open_channel();

  /**
   * @brief Simulate losing the connection: every channel is notified, consumers are
   *        cancelled, and unacknowledged messages are requeued as redelivered. Nothing is
   *        delivered until `reconnect`.
   */
  void disconnect();

  /** @brief Restore the connection; every open channel is notified */
  void reconnect();

  bool is_connected() const;

  ///@{ Inspection
  bool has_exchange(std::string_view name) const;
  bool has_queue(std::string_view name) const;

  /** @brief Messages waiting in queue `name` (not counting unacknowledged ones) */
  std::size_t queue_depth(std::string_view name) const;
  std::size_t consumer_count(std::string_view name) const;
  std::size_t unacked_count() const;
  ///@}
};

} // namespace courier::mq
