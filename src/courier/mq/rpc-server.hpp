#pragma once

#include "channel-owner.hpp"
#include "endpoint-config.hpp"
#include "message.hpp"
#include "transport.hpp"

#include "courier/async/extended-futures.hpp"

#include <boost/asio/io_context.hpp>

#include <exception>
#include <memory>
#include <string>

namespace courier::mq {

// --------------------------------------------------------------------------------------- Processor

/**
 * @brief Turns requests into replies.
 */
class Processor {
public:
  virtual ~Processor() = default;

  /**
   * @brief Process `delivery`. May throw, or fail the returned future; either way
   *        `on_failure` is asked for the reply.
   */
  virtual async::Future<ProcessResult> process(const Delivery& delivery) = 0;

  /**
   * @brief The reply for a delivery whose processing failed with `error`.
   */
  virtual ProcessResult on_failure(const Delivery& delivery, std::exception_ptr error) = 0;
};

// --------------------------------------------------------------------------------------- RpcServer

/**
 * @brief Consumes a queue, and publishes what a `Processor` makes of each delivery to the
 *        delivery's `reply_to` queue.
 *
 * Deliveries are acknowledged as they arrive, before processing; a crash mid-processing
 * can lose the request, and a redelivery can process it twice. Replies go through the
 * default exchange, carrying the request's correlation id.
 */
class RpcServer final : public ChannelOwner {
public:
  struct Config {
    ExchangeParameters exchange{};
    QueueParameters queue{};
    std::string routing_key{};
    ChannelParameters channel{};
  };

private:
  std::shared_ptr<Processor> processor_;
  Config config_;
  std::string queue_name_{};

  ProcessResult failure_result_(const Delivery& delivery, std::exception_ptr error);
  void publish_result_(const Delivery& delivery, ProcessResult result);

protected:
  std::error_code setup_channel_() override;
  void handle_delivery_(Delivery delivery) override;

public:
  RpcServer(boost::asio::io_context& io_context, std::shared_ptr<Transport> transport,
            std::shared_ptr<Processor> processor, Config config);

  /** @brief The queue being consumed; empty until connected */
  const std::string& queue_name() const noexcept { return queue_name_; }

  const Config& config() const noexcept { return config_; }
};

/**
 * @brief Consume the endpoint's queue, bound to its exchange with the endpoint name as
 *        routing key.
 */
RpcServer::Config make_server_config(const EndpointConfig& endpoint);

} // namespace courier::mq
