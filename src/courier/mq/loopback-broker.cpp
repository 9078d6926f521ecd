#include "loopback-broker.hpp"

#include "courier/utils/base-include.hpp"

#include <boost/asio/post.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <deque>
#include <map>
#include <mutex>
#include <set>

namespace courier::mq::detail {

static constexpr uint16_t k_no_route = 312;
static constexpr uint16_t k_no_consumers = 313;

struct QueuedMessage {
  std::string exchange{};
  std::string routing_key{};
  MessageProperties properties{};
  BufferType body{};
  bool redelivered{false};
};

struct Consumer {
  std::string tag{};
  uint64_t channel_id{0};
};

struct Queue {
  QueueParameters parameters{};
  uint64_t owner{0}; //!< The declaring channel, if exclusive
  std::deque<QueuedMessage> ready{};
  std::vector<Consumer> consumers{};
  std::size_t next_consumer{0};
};

struct Binding {
  std::string queue{};
  std::string routing_key{};
  bool operator==(const Binding&) const = default;
};

struct Exchange {
  ExchangeParameters parameters{};
  std::vector<Binding> bindings{};
};

struct Unacked {
  uint64_t channel_id{0};
  std::string queue{};
  QueuedMessage message{};
};

struct ChannelRecord {
  std::weak_ptr<TransportListener> listener{};
  ChannelParameters qos{0, false};
  bool is_open{false};
};

// ---------------------------------------------------------------------------------- LoopbackState

struct LoopbackState {
  boost::asio::io_context& io_context;
  mutable std::mutex padlock{};
  bool connected{true};
  std::map<std::string, Exchange, std::less<>> exchanges{};
  std::map<std::string, Queue, std::less<>> queues{};
  std::map<uint64_t, Unacked> unacked{};
  std::map<uint64_t, ChannelRecord> channels{};
  uint64_t next_channel_id{1};
  uint64_t next_delivery_tag{1};
  uint64_t next_consumer_tag{1};

  explicit LoopbackState(boost::asio::io_context& context) : io_context{context} {
    exchanges["amq.direct"].parameters = ExchangeParameters{"amq.direct", "direct", false, true};
    exchanges["amq.fanout"].parameters = ExchangeParameters{"amq.fanout", "fanout", false, true};
  }

  // Everything below requires `padlock`

  ChannelRecord* ready_channel_(uint64_t channel_id) {
    auto ii = channels.find(channel_id);
    if (!connected || ii == channels.end() || !ii->second.is_open)
      return nullptr;
    return &ii->second;
  }

  template <typename F> void post_to_(uint64_t channel_id, F f) {
    auto ii = channels.find(channel_id);
    if (ii == channels.end())
      return;
    boost::asio::post(io_context, [listener = ii->second.listener, f = std::move(f)]() mutable {
      if (auto target = listener.lock())
        f(*target);
    });
  }

  std::size_t unacked_for_(uint64_t channel_id) const {
    std::size_t count = 0;
    for (const auto& [tag, entry] : unacked)
      if (entry.channel_id == channel_id)
        ++count;
    return count;
  }

  bool has_capacity_(uint64_t channel_id) const {
    auto ii = channels.find(channel_id);
    if (ii == channels.end())
      return false;
    const auto prefetch = ii->second.qos.prefetch_count;
    return prefetch == 0 || unacked_for_(channel_id) < prefetch;
  }

  void dispatch_(const std::string& queue_name) {
    // Nothing is delivered without a connection; consumers start again after `reconnect`
    if (!connected)
      return;
    auto ii = queues.find(queue_name);
    if (ii == queues.end())
      return;

    auto& queue = ii->second;
    while (!queue.ready.empty() && !queue.consumers.empty()) {
      // Round-robin, skipping consumers whose channel is at its prefetch limit
      const auto n_consumers = queue.consumers.size();
      bool delivered = false;
      for (std::size_t n = 0; n < n_consumers && !delivered; ++n) {
        const auto index = (queue.next_consumer + n) % n_consumers;
        const auto consumer = queue.consumers[index];
        if (!has_capacity_(consumer.channel_id))
          continue;

        queue.next_consumer = (index + 1) % n_consumers;
        auto message = std::move(queue.ready.front());
        queue.ready.pop_front();

        Delivery delivery;
        delivery.delivery_tag = next_delivery_tag++;
        delivery.consumer_tag = consumer.tag;
        delivery.exchange = message.exchange;
        delivery.routing_key = message.routing_key;
        delivery.redelivered = message.redelivered;
        delivery.properties = message.properties;
        delivery.body = message.body;

        unacked.emplace(delivery.delivery_tag,
                        Unacked{consumer.channel_id, queue_name, std::move(message)});
        post_to_(consumer.channel_id, [delivery = std::move(delivery)](
                                          TransportListener& listener) mutable {
          listener.on_delivery(std::move(delivery));
        });
        delivered = true;
      }
      if (!delivered)
        break;
    }
  }

  void dispatch_all_() {
    for (const auto& [name, queue] : queues)
      dispatch_(name);
  }

  void delete_queue_(const std::string& name) {
    TRACE("loopback: deleting queue '{}'", name);
    queues.erase(name);
    for (auto& [exchange_name, exchange] : exchanges)
      std::erase_if(exchange.bindings, [&name](const Binding& binding) {
        return binding.queue == name;
      });
  }

  void cancel_consumers_(uint64_t channel_id) {
    std::vector<std::string> deleted;
    for (auto& [name, queue] : queues) {
      const auto removed = std::erase_if(queue.consumers, [channel_id](const Consumer& consumer) {
        return consumer.channel_id == channel_id;
      });
      if (removed > 0) {
        queue.next_consumer = 0;
        if (queue.parameters.autodelete && queue.consumers.empty())
          deleted.push_back(name);
      }
    }
    for (const auto& name : deleted)
      delete_queue_(name);
  }

  void requeue_unacked_(const std::set<uint64_t>& channel_ids) {
    std::set<std::string> touched;
    // Reverse tag order, so push_front restores the original order
    for (auto ii = unacked.rbegin(); ii != unacked.rend(); ++ii) {
      if (!channel_ids.contains(ii->second.channel_id))
        continue;
      auto queue = queues.find(ii->second.queue);
      if (queue == queues.end())
        continue;
      auto message = std::move(ii->second.message);
      message.redelivered = true;
      queue->second.ready.push_front(std::move(message));
      touched.insert(ii->second.queue);
    }
    std::erase_if(unacked, [&channel_ids](const auto& entry) {
      return channel_ids.contains(entry.second.channel_id);
    });
    for (const auto& name : touched)
      dispatch_(name);
  }

  void delete_exclusive_queues_(uint64_t channel_id) {
    std::vector<std::string> deleted;
    for (const auto& [name, queue] : queues)
      if (queue.owner == channel_id)
        deleted.push_back(name);
    for (const auto& name : deleted)
      delete_queue_(name);
  }

  void release_channels_(const std::set<uint64_t>& channel_ids) {
    for (const auto id : channel_ids)
      cancel_consumers_(id);
    requeue_unacked_(channel_ids);
    for (const auto id : channel_ids)
      delete_exclusive_queues_(id);
  }

  std::error_code route_(std::string_view exchange_name, std::string_view routing_key,
                         std::vector<std::string>& targets) const {
    if (exchange_name.empty()) {
      auto ii = queues.find(routing_key);
      if (ii != queues.end())
        targets.push_back(ii->first);
      return {};
    }

    auto ii = exchanges.find(exchange_name);
    if (ii == exchanges.end())
      return make_error_code(ecode::unknown_exchange);

    const auto& exchange = ii->second;
    const bool is_fanout = (exchange.parameters.type == "fanout");
    for (const auto& binding : exchange.bindings) {
      if (!is_fanout && binding.routing_key != routing_key)
        continue;
      if (std::find(targets.begin(), targets.end(), binding.queue) == targets.end())
        targets.push_back(binding.queue);
    }
    return {};
  }
};

// -------------------------------------------------------------------------------- LoopbackChannel

class LoopbackChannel final : public Transport {
private:
  std::shared_ptr<LoopbackState> state_;
  uint64_t id_;

  // Requires `padlock`
  std::error_code check_ready_() {
    if (!state_->channels.contains(id_))
      return make_error_code(ecode::channel_closed);
    if (state_->ready_channel_(id_) == nullptr)
      return make_error_code(ecode::not_connected);
    return {};
  }

  void post_returned_(uint16_t reply_code, std::string reply_text, std::string_view exchange,
                      std::string_view routing_key, const Envelope& envelope) {
    ReturnedMessage returned;
    returned.reply_code = reply_code;
    returned.reply_text = std::move(reply_text);
    returned.exchange = std::string{exchange};
    returned.routing_key = std::string{routing_key};
    returned.properties = envelope.properties;
    returned.body = envelope.body;
    state_->post_to_(id_, [returned = std::move(returned)](TransportListener& listener) mutable {
      listener.on_returned(std::move(returned));
    });
  }

public:
  LoopbackChannel(std::shared_ptr<LoopbackState> state, uint64_t id)
      : state_{std::move(state)}, id_{id} {}

  ~LoopbackChannel() override { close(); }

  void open(std::weak_ptr<TransportListener> listener) override {
    std::lock_guard lock{state_->padlock};
    auto ii = state_->channels.find(id_);
    if (ii == state_->channels.end()) {
      WARN("loopback: channel {} is closed, and cannot be reopened", id_);
      return;
    }
    ii->second.listener = std::move(listener);
    ii->second.is_open = true;
    if (state_->connected)
      state_->post_to_(id_, [](TransportListener& target) { target.on_connected(); });
  }

  void close() override {
    std::lock_guard lock{state_->padlock};
    if (!state_->channels.contains(id_))
      return;
    state_->release_channels_({id_});
    state_->channels.erase(id_);
  }

  std::error_code set_qos(const ChannelParameters& parameters) override {
    std::lock_guard lock{state_->padlock};
    if (auto ec = check_ready_())
      return ec;
    state_->channels.at(id_).qos = parameters;
    state_->dispatch_all_();
    return {};
  }

  std::error_code declare_exchange(const ExchangeParameters& parameters) override {
    std::lock_guard lock{state_->padlock};
    if (auto ec = check_ready_())
      return ec;
    if (parameters.name.empty())
      return make_error_code(ecode::argument_error);

    auto ii = state_->exchanges.find(parameters.name);
    if (ii != state_->exchanges.end()) {
      if (!parameters.passive && ii->second.parameters.type != parameters.type)
        return make_error_code(ecode::precondition_failed);
      return {};
    }
    if (parameters.passive)
      return make_error_code(ecode::unknown_exchange);
    if (parameters.type != "direct" && parameters.type != "fanout") {
      WARN("loopback: exchange type '{}' is not supported", parameters.type);
      return make_error_code(ecode::argument_error);
    }

    state_->exchanges[parameters.name].parameters = parameters;
    return {};
  }

  tl::expected<std::string, std::error_code>
  declare_queue(const QueueParameters& parameters) override {
    thread_local boost::uuids::random_generator generator;

    std::lock_guard lock{state_->padlock};
    if (auto ec = check_ready_())
      return tl::make_unexpected(ec);

    auto name = parameters.name.empty() ? "amq.gen-" + boost::uuids::to_string(generator())
                                        : parameters.name;
    auto ii = state_->queues.find(name);
    if (ii != state_->queues.end()) {
      const auto& queue = ii->second;
      if (queue.owner != 0 && queue.owner != id_)
        return tl::make_unexpected(make_error_code(ecode::resource_locked));
      if (!parameters.passive && (queue.parameters.durable != parameters.durable ||
                                  queue.parameters.exclusive != parameters.exclusive ||
                                  queue.parameters.autodelete != parameters.autodelete))
        return tl::make_unexpected(make_error_code(ecode::precondition_failed));
      return name;
    }
    if (parameters.passive)
      return tl::make_unexpected(make_error_code(ecode::unknown_queue));

    auto& queue = state_->queues[name];
    queue.parameters = parameters;
    queue.parameters.name = name;
    queue.owner = parameters.exclusive ? id_ : 0;
    return name;
  }

  std::error_code bind(std::string_view exchange, std::string_view queue,
                       std::string_view routing_key) override {
    std::lock_guard lock{state_->padlock};
    if (auto ec = check_ready_())
      return ec;
    if (exchange.empty())
      return make_error_code(ecode::argument_error);

    auto ii = state_->exchanges.find(exchange);
    if (ii == state_->exchanges.end())
      return make_error_code(ecode::unknown_exchange);
    if (!state_->queues.contains(queue))
      return make_error_code(ecode::unknown_queue);

    Binding binding{std::string{queue}, std::string{routing_key}};
    auto& bindings = ii->second.bindings;
    if (std::find(bindings.begin(), bindings.end(), binding) == bindings.end())
      bindings.push_back(std::move(binding));
    return {};
  }

  tl::expected<std::string, std::error_code> consume(std::string_view queue_name) override {
    std::lock_guard lock{state_->padlock};
    if (auto ec = check_ready_())
      return tl::make_unexpected(ec);

    auto ii = state_->queues.find(queue_name);
    if (ii == state_->queues.end())
      return tl::make_unexpected(make_error_code(ecode::unknown_queue));
    auto& queue = ii->second;
    if (queue.owner != 0 && queue.owner != id_)
      return tl::make_unexpected(make_error_code(ecode::resource_locked));

    auto tag = format("ctag-{}", state_->next_consumer_tag++);
    queue.consumers.push_back(Consumer{tag, id_});
    state_->dispatch_(ii->first);
    return tag;
  }

  std::error_code publish(std::string_view exchange, std::string_view routing_key,
                          const Envelope& envelope, bool mandatory, bool immediate) override {
    std::lock_guard lock{state_->padlock};
    if (auto ec = check_ready_())
      return ec;

    std::vector<std::string> targets;
    if (auto ec = state_->route_(exchange, routing_key, targets))
      return ec;

    if (targets.empty()) {
      if (mandatory)
        post_returned_(k_no_route, "NO_ROUTE", exchange, routing_key, envelope);
      else
        TRACE("loopback: dropping unroutable message to '{}'/'{}'", exchange, routing_key);
      return {};
    }

    if (immediate) {
      const bool has_consumer =
          std::any_of(targets.begin(), targets.end(), [this](const std::string& name) {
            return !state_->queues.at(name).consumers.empty();
          });
      if (!has_consumer) {
        post_returned_(k_no_consumers, "NO_CONSUMERS", exchange, routing_key, envelope);
        return {};
      }
    }

    for (const auto& name : targets) {
      state_->queues.at(name).ready.push_back(QueuedMessage{
          std::string{exchange}, std::string{routing_key}, envelope.properties, envelope.body});
      state_->dispatch_(name);
    }
    return {};
  }

  std::error_code ack(uint64_t delivery_tag) override {
    std::lock_guard lock{state_->padlock};
    if (auto ec = check_ready_())
      return ec;

    auto ii = state_->unacked.find(delivery_tag);
    if (ii == state_->unacked.end() || ii->second.channel_id != id_)
      return make_error_code(ecode::precondition_failed);
    state_->unacked.erase(ii);
    state_->dispatch_all_();
    return {};
  }
};

} // namespace courier::mq::detail

namespace courier::mq {

// --------------------------------------------------------------------------------- LoopbackBroker

LoopbackBroker::LoopbackBroker(boost::asio::io_context& io_context)
    : state_{std::make_shared<detail::LoopbackState>(io_context)} {}

LoopbackBroker::~LoopbackBroker() = default;

std::shared_ptr<Transport> LoopbackBroker::open_channel() {
  std::lock_guard lock{state_->padlock};
  const auto id = state_->next_channel_id++;
  state_->channels.emplace(id, detail::ChannelRecord{});
  return std::make_shared<detail::LoopbackChannel>(state_, id);
}

void LoopbackBroker::disconnect() {
  std::lock_guard lock{state_->padlock};
  if (!state_->connected)
    return;
  INFO("loopback: connection lost");
  state_->connected = false;
  std::set<uint64_t> open_channels;
  for (const auto& [id, channel] : state_->channels)
    if (channel.is_open)
      open_channels.insert(id);
  state_->release_channels_(open_channels);
  for (const auto id : open_channels)
    state_->post_to_(id, [](TransportListener& listener) { listener.on_disconnected(); });
}

void LoopbackBroker::reconnect() {
  std::lock_guard lock{state_->padlock};
  if (state_->connected)
    return;
  INFO("loopback: connection restored");
  state_->connected = true;
  for (auto& [id, channel] : state_->channels)
    if (channel.is_open)
      state_->post_to_(id, [](TransportListener& listener) { listener.on_connected(); });
}

bool LoopbackBroker::is_connected() const {
  std::lock_guard lock{state_->padlock};
  return state_->connected;
}

bool LoopbackBroker::has_exchange(std::string_view name) const {
  std::lock_guard lock{state_->padlock};
  return state_->exchanges.contains(name);
}

bool LoopbackBroker::has_queue(std::string_view name) const {
  std::lock_guard lock{state_->padlock};
  return state_->queues.contains(name);
}

std::size_t LoopbackBroker::queue_depth(std::string_view name) const {
  std::lock_guard lock{state_->padlock};
  auto ii = state_->queues.find(name);
  return (ii == state_->queues.end()) ? 0 : ii->second.ready.size();
}

std::size_t LoopbackBroker::consumer_count(std::string_view name) const {
  std::lock_guard lock{state_->padlock};
  auto ii = state_->queues.find(name);
  return (ii == state_->queues.end()) ? 0 : ii->second.consumers.size();
}

std::size_t LoopbackBroker::unacked_count() const {
  std::lock_guard lock{state_->padlock};
  return state_->unacked.size();
}

} // namespace courier::mq
