#include "rpc-client.hpp"
#include "rpc-error.hpp"

#include "courier/utils/base-include.hpp"

#include <boost/asio/post.hpp>

namespace courier::mq {

RpcClient::Config make_client_config(const EndpointConfig& endpoint) {
  RpcClient::Config config;
  config.exchange = endpoint.exchange.name;
  config.routing_key = endpoint.name;
  config.channel = endpoint.channel;
  return config;
}

RpcClient::RpcClient(boost::asio::io_context& io_context, std::shared_ptr<Transport> transport,
                     Config config)
    : ChannelOwner{io_context, std::move(transport), format("rpc-client({})", config.exchange)},
      config_{std::move(config)} {}

// ------------------------------------------------------------------------------------ send-request

async::Future<RpcOutcome> RpcClient::send_request(std::vector<Envelope> envelopes,
                                                   uint32_t expected) {
  async::Promise<RpcOutcome> promise;
  auto future = promise.get_future();
  boost::asio::post(strand_, [self = shared_from_this_as_<RpcClient>(),
                              envelopes = std::move(envelopes), expected,
                              promise = std::move(promise)]() mutable {
    self->send_(std::move(envelopes), expected, std::move(promise));
  });
  return future;
}

void RpcClient::send_(std::vector<Envelope> envelopes, uint32_t expected,
                      async::Promise<RpcOutcome> promise) {
  if (!is_connected_()) {
    WARN("{}: rejecting request while disconnected", name_);
    promise.set_exception(std::make_exception_ptr(RpcError{make_error_code(ecode::not_connected)}));
    return;
  }

  if (expected == 0) {
    for (auto& envelope : envelopes) {
      auto ec = transport_->publish(config_.exchange, config_.routing_key, envelope,
                                    config_.mandatory, config_.immediate);
      if (ec) {
        WARN("{}: publish failed: {}", name_, ec.message());
        promise.set_exception(std::make_exception_ptr(RpcError{ec}));
        return;
      }
    }
    promise.set_value(RpcOutcome{Response{}});
    return;
  }

  if (envelopes.empty()) {
    promise.set_exception(std::make_exception_ptr(
        RpcError{make_error_code(ecode::argument_error), "expected replies to no requests"}));
    return;
  }

  auto correlation_id = std::to_string(++counter_);
  for (auto& envelope : envelopes) {
    envelope.properties.correlation_id = correlation_id;
    envelope.properties.reply_to = reply_queue_;
  }

  if (!table_.insert(correlation_id, std::move(promise), expected)) {
    LOG_ERR("{}: correlation id {} is already pending", name_, correlation_id);
    return;
  }

  TRACE("{}: request {} expects {} replies", name_, correlation_id, expected);
  for (const auto& envelope : envelopes) {
    auto ec = transport_->publish(config_.exchange, config_.routing_key, envelope,
                                  config_.mandatory, config_.immediate);
    if (ec) {
      WARN("{}: publish of request {} failed: {}", name_, correlation_id, ec.message());
      if (auto request = table_.take(correlation_id))
        request->destination.set_exception(std::make_exception_ptr(RpcError{ec}));
      return;
    }
  }
}

// ----------------------------------------------------------------------------------- channel hooks

std::error_code RpcClient::setup_channel_() {
  if (auto ec = transport_->set_qos(config_.channel))
    return ec;

  QueueParameters parameters;
  if (config_.reply_queue) {
    parameters = *config_.reply_queue;
  } else {
    parameters.exclusive = true;
    parameters.autodelete = true;
  }

  auto queue = transport_->declare_queue(parameters);
  if (!queue)
    return queue.error();

  auto consumer_tag = transport_->consume(*queue);
  if (!consumer_tag)
    return consumer_tag.error();

  reply_queue_ = std::move(*queue);
  LOG_DEBUG("{}: consuming replies from '{}'", name_, reply_queue_);
  return {};
}

void RpcClient::reset_channel_state_() {
  const auto dropped = table_.clear();
  if (dropped > 0)
    WARN("{}: abandoning {} pending requests", name_, dropped);
}

void RpcClient::handle_delivery_(Delivery delivery) {
  if (auto ec = transport_->ack(delivery.delivery_tag))
    WARN("{}: failed to ack delivery {}: {}", name_, delivery.delivery_tag, ec.message());

  const auto correlation_id = delivery.properties.correlation_id;
  const auto result = table_.append(std::move(delivery));
  if (result == CorrelationTable::MatchResult::UNKNOWN) {
    WARN("{}: dropping reply for unknown correlation id '{}'", name_, correlation_id);
  } else {
    TRACE("{}: reply for {}: {}", name_, correlation_id, str(result));
  }
}

void RpcClient::handle_returned_(ReturnedMessage returned) {
  const auto correlation_id = returned.properties.correlation_id;
  const auto reply_code = returned.reply_code;
  if (!table_.mark_undelivered(std::move(returned))) {
    WARN("{}: dropping returned message for unknown correlation id '{}'", name_, correlation_id);
  } else {
    LOG_DEBUG("{}: request {} undelivered ({})", name_, correlation_id, reply_code);
  }
}

} // namespace courier::mq
