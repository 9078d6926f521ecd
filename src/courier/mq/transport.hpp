#pragma once

#include "message.hpp"

#include <tl/expected.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace courier::mq {

// ---------------------------------------------------------------------------------- Topology types

struct ExchangeParameters {
  std::string name{};
  std::string type{"direct"}; //!< "direct" or "fanout"
  bool passive{false};        //!< Only check that the exchange exists
  bool durable{false};
  bool autodelete{false};
};

struct QueueParameters {
  std::string name{}; //!< Empty means the broker names the queue
  bool passive{false};
  bool durable{false};
  bool exclusive{false}; //!< Owned by the declaring channel, deleted when it closes
  bool autodelete{false};
};

struct ChannelParameters {
  uint16_t prefetch_count{1};
  bool prefetch_is_global{false};
};

// ------------------------------------------------------------------------------- TransportListener

/**
 * @brief Receives the asynchronous events of one transport channel.
 *
 * Calls may come from any thread.
 */
class TransportListener {
public:
  virtual ~TransportListener() = default;

  virtual void on_connected() = 0;
  virtual void on_disconnected() = 0;

  /** @brief A message from a consumed queue; must be acknowledged with `Transport::ack` */
  virtual void on_delivery(Delivery delivery) = 0;

  /** @brief A `mandatory` or `immediate` message could not be delivered */
  virtual void on_returned(ReturnedMessage returned) = 0;
};

// --------------------------------------------------------------------------------------- Transport

/**
 * @brief One channel to a message broker.
 *
 * `open` starts connecting, and `on_connected` follows once the channel is usable. Topology
 * must be declared again after every `on_connected`. Operations on a channel that is not
 * connected fail with `ecode::not_connected`, and on a closed channel with
 * `ecode::channel_closed`.
 */
class Transport {
public:
  virtual ~Transport() = default;

  virtual void open(std::weak_ptr<TransportListener> listener) = 0;
  virtual void close() = 0;

  virtual std::error_code set_qos(const ChannelParameters& parameters) = 0;

  virtual std::error_code declare_exchange(const ExchangeParameters& parameters) = 0;

  /** @brief Declare a queue, returning its name, which the broker chooses if none was given */
  virtual tl::expected<std::string, std::error_code>
  declare_queue(const QueueParameters& parameters) = 0;

  virtual std::error_code bind(std::string_view exchange, std::string_view queue,
                               std::string_view routing_key) = 0;

  /** @brief Start consuming `queue` with manual acknowledgement, returning the consumer tag */
  virtual tl::expected<std::string, std::error_code> consume(std::string_view queue) = 0;

  virtual std::error_code publish(std::string_view exchange, std::string_view routing_key,
                                  const Envelope& envelope, bool mandatory, bool immediate) = 0;

  virtual std::error_code ack(uint64_t delivery_tag) = 0;
};

} // namespace courier::mq
