#pragma once

#include "message.hpp"
#include "transport.hpp"

#include "courier/async/execution-broker.hpp"
#include "courier/async/extended-futures.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace courier::mq {

enum class ConnectionState : int8_t { DISCONNECTED, CONNECTED };

const char* str(ConnectionState state);

/**
 * @brief Owns one transport channel, and tracks whether it is usable.
 *
 * Transport notifications are posted onto the owner's strand, so subclasses see
 * connection changes, deliveries and returns one at a time, in order, and can keep
 * their state without locks. On every connection the subclass declares its topology
 * in `setup_channel_`; only if that succeeds does the owner become `CONNECTED`.
 * Deliveries and returns that arrive while `DISCONNECTED` are dropped.
 *
 * Must be owned by a `std::shared_ptr`.
 */
class ChannelOwner : public TransportListener, public std::enable_shared_from_this<ChannelOwner> {
public:
  using StrandType = boost::asio::strand<boost::asio::io_context::executor_type>;

protected:
  StrandType strand_;
  std::shared_ptr<Transport> transport_;
  std::string name_; //!< For logging

private:
  ConnectionState state_ = ConnectionState::DISCONNECTED;
  std::vector<async::Promise<void>> connected_waiters_{};

  void handle_connected_();
  void handle_disconnected_();

public:
  ChannelOwner(boost::asio::io_context& io_context, std::shared_ptr<Transport> transport,
               std::string name);
  ChannelOwner(const ChannelOwner&) = delete;
  ChannelOwner& operator=(const ChannelOwner&) = delete;
  ~ChannelOwner() override;

  /** @brief Open the transport; `CONNECTED` follows asynchronously */
  void start();

  /** @brief Close the transport, and enter `DISCONNECTED` */
  void stop();

  /** @brief Resolves once the owner is (or next becomes) `CONNECTED` */
  async::Future<void> when_connected();

  /** @brief The current state; only meaningful on the strand, or while the io_context is idle */
  ConnectionState state() const noexcept { return state_; }

  const std::string& name() const noexcept { return name_; }

  /** @brief Runs continuations on this owner's strand */
  async::StrandBroker get_execution_broker() const { return async::StrandBroker{strand_}; }

  ///@{ TransportListener, may be called from any thread
  void on_connected() final;
  void on_disconnected() final;
  void on_delivery(Delivery delivery) final;
  void on_returned(ReturnedMessage returned) final;
  ///@}

protected:
  bool is_connected_() const noexcept { return state_ == ConnectionState::CONNECTED; }

  template <typename T> std::shared_ptr<T> shared_from_this_as_() {
    return std::static_pointer_cast<T>(shared_from_this());
  }

  /** @brief Declare topology and start consuming; an error keeps the owner `DISCONNECTED` */
  virtual std::error_code setup_channel_() = 0;

  /** @brief Called on the strand on every connection change, before `setup_channel_` */
  virtual void reset_channel_state_() {}

  virtual void handle_delivery_(Delivery delivery) = 0;
  virtual void handle_returned_(ReturnedMessage returned);
};

} // namespace courier::mq
