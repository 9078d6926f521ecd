#pragma once

#include "courier/mq/archive.hpp"
#include "courier/mq/transport.hpp"

#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace courier::mq::testing {

// ------------------------------------------------------------------------------------- messages

struct DoubleRequest {
  int64_t value = 0;
  template <typename Archive, typename Self> static void fields(Archive& ar, Self& self) {
    ar("value", self.value);
  }
};

struct DoubleResponse {
  int64_t value = 0;
  template <typename Archive, typename Self> static void fields(Archive& ar, Self& self) {
    ar("value", self.value);
  }
};

struct Everything {
  bool flag = false;
  int32_t small = 0;
  uint64_t big = 0;
  double ratio = 0.0;
  std::string text{};

  template <typename Archive, typename Self> static void fields(Archive& ar, Self& self) {
    ar("flag", self.flag)("small", self.small)("big", self.big)("ratio", self.ratio)("text",
                                                                                     self.text);
  }
  bool operator==(const Everything&) const = default;
};

/**
 * Run every handler that is ready, including the ones they post.
 */
inline void drain(boost::asio::io_context& io_context) {
  io_context.restart();
  io_context.poll();
}

// -------------------------------------------------------------------------------- FakeTransport

/**
 * A transport that records what it is asked to do. Tests raise the listener events.
 */
class FakeTransport final : public Transport {
public:
  struct Published {
    std::string exchange{};
    std::string routing_key{};
    Envelope envelope{};
    bool mandatory{false};
    bool immediate{false};
  };

  std::weak_ptr<TransportListener> listener{};
  bool is_open = false;
  int close_count = 0;

  std::vector<ExchangeParameters> exchanges{};
  std::vector<QueueParameters> queues{};
  std::vector<std::string> bindings{}; //!< "exchange/queue/routing-key"
  std::vector<std::string> consumed{};
  std::vector<ChannelParameters> qos{};
  std::vector<Published> published{};
  std::vector<uint64_t> acked{};

  std::string broker_queue_name = "amq.gen-reply";
  std::error_code declare_queue_error{};
  std::error_code publish_error{};

  void open(std::weak_ptr<TransportListener> new_listener) override {
    listener = std::move(new_listener);
    is_open = true;
  }
  void close() override {
    is_open = false;
    ++close_count;
  }

  std::error_code set_qos(const ChannelParameters& parameters) override {
    qos.push_back(parameters);
    return {};
  }

  std::error_code declare_exchange(const ExchangeParameters& parameters) override {
    exchanges.push_back(parameters);
    return {};
  }

  tl::expected<std::string, std::error_code>
  declare_queue(const QueueParameters& parameters) override {
    if (declare_queue_error)
      return tl::make_unexpected(declare_queue_error);
    queues.push_back(parameters);
    return parameters.name.empty() ? broker_queue_name : parameters.name;
  }

  std::error_code bind(std::string_view exchange, std::string_view queue,
                       std::string_view routing_key) override {
    bindings.push_back(std::string{exchange} + "/" + std::string{queue} + "/" +
                       std::string{routing_key});
    return {};
  }

  tl::expected<std::string, std::error_code> consume(std::string_view queue) override {
    consumed.emplace_back(queue);
    return std::string{"ctag-"} + std::to_string(consumed.size());
  }

  std::error_code publish(std::string_view exchange, std::string_view routing_key,
                          const Envelope& envelope, bool mandatory, bool immediate) override {
    if (publish_error)
      return publish_error;
    published.push_back(Published{std::string{exchange}, std::string{routing_key}, envelope,
                                  mandatory, immediate});
    return {};
  }

  std::error_code ack(uint64_t delivery_tag) override {
    acked.push_back(delivery_tag);
    return {};
  }

  ///@{ Raise listener events, as a broker would
  void connect() { listener.lock()->on_connected(); }
  void disconnect() { listener.lock()->on_disconnected(); }
  void deliver(Delivery delivery) { listener.lock()->on_delivery(std::move(delivery)); }
  void return_message(ReturnedMessage returned) { listener.lock()->on_returned(std::move(returned)); }
  ///@}
};

/**
 * A reply, as a server would send it for a request.
 */
inline Delivery make_reply(uint64_t delivery_tag, std::string correlation_id,
                           std::string_view body = "{}") {
  Delivery delivery;
  delivery.delivery_tag = delivery_tag;
  delivery.properties.correlation_id = std::move(correlation_id);
  delivery.body = make_send_buffer(body);
  return delivery;
}

} // namespace courier::mq::testing
