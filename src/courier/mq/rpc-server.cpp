#include "rpc-server.hpp"

#include "courier/utils/base-include.hpp"

namespace courier::mq {

RpcServer::Config make_server_config(const EndpointConfig& endpoint) {
  RpcServer::Config config;
  config.exchange = endpoint.exchange;
  config.queue = endpoint.queue;
  config.routing_key = endpoint.name;
  config.channel = endpoint.channel;
  return config;
}

RpcServer::RpcServer(boost::asio::io_context& io_context, std::shared_ptr<Transport> transport,
                     std::shared_ptr<Processor> processor, Config config)
    : ChannelOwner{io_context, std::move(transport), format("rpc-server({})", config.queue.name)},
      processor_{std::move(processor)}, config_{std::move(config)} {
  Expects(processor_ != nullptr);
}

// -------------------------------------------------------------------------------------- topology

std::error_code RpcServer::setup_channel_() {
  const auto& exchange = config_.exchange;
  const bool use_default_exchange = exchange.name.empty();

  if (!use_default_exchange) {
    if (auto ec = transport_->declare_exchange(exchange)) {
      LOG_ERR("{}: failed to declare exchange '{}': {}", name_, exchange.name, ec.message());
      return ec;
    }
  }

  auto queue = transport_->declare_queue(config_.queue);
  if (!queue)
    return queue.error();

  // Every queue is implicitly bound to the default exchange by its name
  if (!use_default_exchange) {
    if (auto ec = transport_->bind(exchange.name, *queue, config_.routing_key))
      return ec;
  }

  if (auto ec = transport_->set_qos(config_.channel))
    return ec;

  auto consumer_tag = transport_->consume(*queue);
  if (!consumer_tag)
    return consumer_tag.error();

  queue_name_ = std::move(*queue);
  LOG_DEBUG("{}: consuming '{}' as {}", name_, queue_name_, *consumer_tag);
  return {};
}

// ------------------------------------------------------------------------------------- deliveries

void RpcServer::handle_delivery_(Delivery delivery) {
  if (auto ec = transport_->ack(delivery.delivery_tag))
    WARN("{}: failed to ack delivery {}: {}", name_, delivery.delivery_tag, ec.message());

  auto request = std::make_shared<const Delivery>(std::move(delivery));

  async::Future<ProcessResult> future;
  try {
    future = processor_->process(*request);
  } catch (...) {
    publish_result_(*request, failure_result_(*request, std::current_exception()));
    return;
  }

  if (!future.valid()) {
    auto error = std::make_exception_ptr(std::future_error{std::future_errc::no_state});
    publish_result_(*request, failure_result_(*request, error));
    return;
  }

  future.on_ready(get_execution_broker(), [self = shared_from_this_as_<RpcServer>(),
                                           request](async::Future<ProcessResult> ready) {
    ProcessResult result;
    try {
      result = ready.get();
    } catch (...) {
      result = self->failure_result_(*request, std::current_exception());
    }
    self->publish_result_(*request, std::move(result));
  });
}

ProcessResult RpcServer::failure_result_(const Delivery& delivery, std::exception_ptr error) {
  try {
    return processor_->on_failure(delivery, std::move(error));
  } catch (const std::exception& e) {
    LOG_ERR("{}: on_failure threw, no reply for delivery {}: {}", name_, delivery.delivery_tag,
            e.what());
  } catch (...) {
    LOG_ERR("{}: on_failure threw a non-standard exception, no reply for delivery {}", name_,
            delivery.delivery_tag);
  }
  return ProcessResult{};
}

void RpcServer::publish_result_(const Delivery& delivery, ProcessResult result) {
  if (!is_connected_()) {
    WARN("{}: dropping reply to '{}' while disconnected", name_, delivery.properties.reply_to);
    return;
  }

  if (!result.payload) {
    TRACE("{}: no reply for delivery {}", name_, delivery.delivery_tag);
    return;
  }

  const auto& reply_to = delivery.properties.reply_to;
  if (reply_to.empty()) {
    LOG_DEBUG("{}: delivery {} has no reply_to, discarding reply", name_, delivery.delivery_tag);
    return;
  }

  Envelope reply;
  reply.body = std::move(*result.payload);
  reply.properties = result.properties.value_or(MessageProperties{});
  reply.properties.correlation_id = delivery.properties.correlation_id;
  reply.properties.reply_to.clear();

  if (auto ec = transport_->publish("", reply_to, reply, false, false))
    WARN("{}: failed to publish reply to '{}': {}", name_, reply_to, ec.message());
}

} // namespace courier::mq
