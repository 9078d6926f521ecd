#pragma once

#include "channel-owner.hpp"
#include "correlation-table.hpp"
#include "endpoint-config.hpp"
#include "message.hpp"
#include "transport.hpp"

#include "courier/async/extended-futures.hpp"

#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace courier::mq {

/**
 * @brief Sends requests to an exchange, and gathers the replies for each one.
 *
 * Every request with `expected > 0` replies gets a fresh correlation id (a counter, as a
 * decimal string), and the client's reply queue as its `reply_to`. Replies are matched
 * back by correlation id in a `CorrelationTable`. A connection change clears the table
 * without resolving the futures of the requests in it.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * auto client = std::make_shared<RpcClient>(io_context, broker.open_channel(), config);
 * client->start();
 * auto future = client->send_request({std::move(envelope)}, 1);
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
class RpcClient final : public ChannelOwner {
public:
  struct Config {
    std::string exchange{};
    std::string routing_key{};
    bool mandatory{true};
    bool immediate{false};
    std::optional<QueueParameters> reply_queue{}; //!< If unset, an exclusive broker-named queue
    ChannelParameters channel{};
  };

private:
  Config config_;
  CorrelationTable table_{};
  uint64_t counter_{0};
  std::string reply_queue_{};

  void send_(std::vector<Envelope> envelopes, uint32_t expected,
             async::Promise<RpcOutcome> promise);

protected:
  std::error_code setup_channel_() override;
  void reset_channel_state_() override;
  void handle_delivery_(Delivery delivery) override;
  void handle_returned_(ReturnedMessage returned) override;

public:
  RpcClient(boost::asio::io_context& io_context, std::shared_ptr<Transport> transport,
            Config config);

  /**
   * @brief Publish `envelopes`, and resolve with the next `expected` replies.
   *
   * `expected == 0` resolves with an empty `Response` as soon as the envelopes are
   * published. The future fails with `RpcError`: `ecode::not_connected` if the client is
   * not connected, `ecode::argument_error` if replies are expected for no envelopes, or
   * the transport's error if publishing fails.
   */
  async::Future<RpcOutcome> send_request(std::vector<Envelope> envelopes, uint32_t expected);

  /** @brief Number of requests awaiting replies; only meaningful on the strand, or while idle */
  std::size_t pending_count() const noexcept { return table_.size(); }

  /** @brief The queue replies arrive on; empty until connected */
  const std::string& reply_queue_name() const noexcept { return reply_queue_; }

  const Config& config() const noexcept { return config_; }
};

/**
 * @brief Publish to the endpoint's exchange with the endpoint name as routing key.
 */
RpcClient::Config make_client_config(const EndpointConfig& endpoint);

} // namespace courier::mq
