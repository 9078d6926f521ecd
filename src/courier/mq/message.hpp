#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace courier::mq {

/**
 * @brief Message bodies, as they travel through the broker.
 */
using BufferType = std::vector<std::byte>;

inline std::span<const std::byte> to_span_bytes(const BufferType& buffer) {
  return {buffer.data(), buffer.data() + buffer.size()};
}

inline BufferType make_send_buffer(std::string_view ss) {
  const std::byte* data = reinterpret_cast<const std::byte*>(ss.data());
  return BufferType{data, data + ss.size()};
}

inline BufferType make_send_buffer(std::span<const std::byte> ss) {
  return BufferType{ss.begin(), ss.end()};
}

inline std::string_view str(std::span<const std::byte> payload) {
  return {reinterpret_cast<const char*>(payload.data()), payload.size()};
}

inline BufferType& operator<<(BufferType& buffer, std::string_view ss) {
  const auto offset = buffer.size();
  buffer.resize(offset + ss.size());
  if (!ss.empty())
    std::memcpy(&buffer[offset], ss.data(), ss.size());
  return buffer;
}

// ------------------------------------------------------------------------------- MessageProperties

/**
 * @brief Broker message properties.
 *
 * `content_encoding` and `content_type` are the envelope metadata: the name of the
 * serializer, and the (diagnostic) type name of the message. `correlation_id` and
 * `reply_to` are owned by the rpc client and server.
 */
struct MessageProperties {
  std::string content_encoding{};
  std::string content_type{};
  std::string correlation_id{};
  std::string reply_to{};
  uint8_t delivery_mode{1}; //!< 1 = transient, 2 = persistent

  bool operator==(const MessageProperties&) const = default;
};

/**
 * @brief One serialized application message: body and metadata
 */
struct Envelope {
  BufferType body{};
  MessageProperties properties{};
};

/**
 * @brief One inbound message instance, with its acknowledgement handle
 */
struct Delivery {
  uint64_t delivery_tag{0};
  std::string consumer_tag{};
  std::string exchange{};
  std::string routing_key{};
  bool redelivered{false};
  MessageProperties properties{};
  BufferType body{};
};

/**
 * @brief The broker could not route a `mandatory` (or `immediate`) message
 */
struct ReturnedMessage {
  uint16_t reply_code{0};
  std::string reply_text{};
  std::string exchange{};
  std::string routing_key{};
  MessageProperties properties{};
  BufferType body{};
};

/**
 * @brief What a `Processor` produces for a delivery.
 *
 * An empty `payload` means no reply is sent.
 */
struct ProcessResult {
  std::optional<BufferType> payload{};
  std::optional<MessageProperties> properties{};
};

// ------------------------------------------------------------------------------------ RpcOutcome

/**
 * @brief All the replies for one request, in arrival order
 */
struct Response {
  std::vector<Delivery> deliveries{};
};

/**
 * @brief The request could not be routed to any queue
 */
struct Undelivered {
  ReturnedMessage message{};
};

using RpcOutcome = std::variant<Response, Undelivered>;

} // namespace courier::mq
