#include "channel-owner.hpp"

#include "courier/utils/base-include.hpp"

#include <boost/asio/post.hpp>

namespace courier::mq {

const char* str(ConnectionState state) {
  switch (state) {
  case ConnectionState::DISCONNECTED: return "DISCONNECTED";
  case ConnectionState::CONNECTED: return "CONNECTED";
  }
  return "<unknown>";
}

// ------------------------------------------------------------------------------------ construction

ChannelOwner::ChannelOwner(boost::asio::io_context& io_context,
                           std::shared_ptr<Transport> transport, std::string name)
    : strand_{boost::asio::make_strand(io_context)}, transport_{std::move(transport)},
      name_{std::move(name)} {
  Expects(transport_ != nullptr);
}

ChannelOwner::~ChannelOwner() { transport_->close(); }

void ChannelOwner::start() { transport_->open(weak_from_this()); }

void ChannelOwner::stop() {
  transport_->close();
  boost::asio::post(strand_, [self = shared_from_this()]() { self->handle_disconnected_(); });
}

async::Future<void> ChannelOwner::when_connected() {
  async::Promise<void> promise;
  auto future = promise.get_future();
  boost::asio::post(strand_, [self = shared_from_this(), promise = std::move(promise)]() mutable {
    if (self->is_connected_())
      promise.set_value();
    else
      self->connected_waiters_.push_back(std::move(promise));
  });
  return future;
}

// ------------------------------------------------------------------------------- transport events

void ChannelOwner::on_connected() {
  boost::asio::post(strand_, [self = shared_from_this()]() { self->handle_connected_(); });
}

void ChannelOwner::on_disconnected() {
  boost::asio::post(strand_, [self = shared_from_this()]() { self->handle_disconnected_(); });
}

void ChannelOwner::on_delivery(Delivery delivery) {
  boost::asio::post(strand_, [self = shared_from_this(), delivery = std::move(delivery)]() mutable {
    if (!self->is_connected_()) {
      WARN("{}: dropping delivery {} while disconnected", self->name_, delivery.delivery_tag);
      return;
    }
    self->handle_delivery_(std::move(delivery));
  });
}

void ChannelOwner::on_returned(ReturnedMessage returned) {
  boost::asio::post(strand_, [self = shared_from_this(), returned = std::move(returned)]() mutable {
    if (!self->is_connected_()) {
      WARN("{}: dropping returned message while disconnected", self->name_);
      return;
    }
    self->handle_returned_(std::move(returned));
  });
}

void ChannelOwner::handle_returned_(ReturnedMessage returned) {
  WARN("{}: message to exchange '{}' returned: {} {}", name_, returned.exchange,
       returned.reply_code, returned.reply_text);
}

// -------------------------------------------------------------------------------- state machine

void ChannelOwner::handle_connected_() {
  reset_channel_state_();
  if (auto ec = setup_channel_()) {
    LOG_ERR("{}: channel setup failed: {}", name_, ec.message());
    state_ = ConnectionState::DISCONNECTED;
    return;
  }

  INFO("{}: {} -> {}", name_, str(state_), str(ConnectionState::CONNECTED));
  state_ = ConnectionState::CONNECTED;
  auto waiters = std::move(connected_waiters_);
  connected_waiters_.clear();
  for (auto& promise : waiters)
    promise.set_value();
}

void ChannelOwner::handle_disconnected_() {
  if (state_ == ConnectionState::CONNECTED)
    INFO("{}: {} -> {}", name_, str(state_), str(ConnectionState::DISCONNECTED));
  state_ = ConnectionState::DISCONNECTED;
  reset_channel_state_();
}

} // namespace courier::mq
