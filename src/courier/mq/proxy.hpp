#pragma once

#include "envelope-codec.hpp"
#include "message.hpp"
#include "rpc-client.hpp"
#include "rpc-error.hpp"
#include "rpc-server.hpp"
#include "server-failure.hpp"

#include "courier/async/execution-broker.hpp"
#include "courier/async/extended-futures.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <utility>
#include <variant>
#include <vector>

namespace courier::mq {

template <typename Reply> using CallResult = std::variant<Reply, Undelivered>;
template <typename Reply> using GatherResult = std::variant<std::vector<Reply>, Undelivered>;

// ---------------------------------------------------------------------------------------- RpcProxy

/**
 * @brief Typed requests over an `RpcClient`.
 *
 * Requests are encoded with the proxy's serializer; each reply is decoded with the
 * serializer it names. A `ServerFailure` reply fails the future with
 * `RemoteProcessingFailure`. Local encode/decode failures fail it with `RpcError`.
 */
class RpcProxy {
private:
  std::shared_ptr<RpcClient> client_;
  std::shared_ptr<const EnvelopeCodec> codec_;
  std::shared_ptr<const Serializer> serializer_;
  async::IoContextBroker executor_;

  template <typename Reply>
  static GatherResult<Reply> decode_outcome_(const EnvelopeCodec& codec, RpcOutcome outcome) {
    if (auto* undelivered = std::get_if<Undelivered>(&outcome))
      return GatherResult<Reply>{std::move(*undelivered)};

    const auto failure_type = codec.content_type_of<ServerFailure>();
    std::vector<Reply> replies;
    for (const auto& delivery : std::get<Response>(outcome).deliveries) {
      const auto body = to_span_bytes(delivery.body);
      if (codec.content_type(delivery.properties) == failure_type) {
        auto failure = codec.deserialize<ServerFailure>(body, delivery.properties);
        if (!failure)
          throw RpcError{failure.error(), "undecodable failure reply"};
        throw RemoteProcessingFailure{failure->message.message, failure->message.details};
      }

      auto decoded = codec.deserialize<Reply>(body, delivery.properties);
      if (!decoded)
        throw RpcError{decoded.error(), format("reply is not a {}", type_name<Reply>())};
      replies.push_back(std::move(decoded->message));
    }
    return GatherResult<Reply>{std::move(replies)};
  }

  template <typename Request>
  tl::expected<std::vector<Envelope>, std::error_code> encode_(const Request& request) const {
    auto envelope = codec_->serialize(request, *serializer_);
    if (!envelope)
      return tl::make_unexpected(envelope.error());
    std::vector<Envelope> envelopes;
    envelopes.push_back(std::move(*envelope));
    return envelopes;
  }

public:
  /**
   * @param serializer Encodes requests; the codec's default if null.
   * @param executor Decodes replies.
   */
  RpcProxy(std::shared_ptr<RpcClient> client, std::shared_ptr<const EnvelopeCodec> codec,
           async::IoContextBroker executor, std::shared_ptr<const Serializer> serializer = nullptr)
      : client_{std::move(client)}, codec_{std::move(codec)},
        serializer_{serializer ? std::move(serializer) : codec_->default_serializer()},
        executor_{std::move(executor)} {}

  /**
   * @brief Send `request` and await `expected` replies, e.g., one from each subscriber of
   *        a fanout exchange.
   */
  template <Message Reply, Message Request>
  async::Future<GatherResult<Reply>> gather(const Request& request, uint32_t expected) {
    auto envelopes = encode_(request);
    if (!envelopes)
      return async::make_exceptional_future<GatherResult<Reply>>(
          std::make_exception_ptr(RpcError{envelopes.error()}));

    return client_->send_request(std::move(*envelopes), expected)
        .then(executor_, [codec = codec_](RpcOutcome outcome) {
          return decode_outcome_<Reply>(*codec, std::move(outcome));
        });
  }

  /**
   * @brief Send `request` and await its single reply.
   */
  template <Message Reply, Message Request>
  async::Future<CallResult<Reply>> call(const Request& request) {
    return gather<Reply>(request, 1).then(executor_, [](GatherResult<Reply> result) {
      if (auto* undelivered = std::get_if<Undelivered>(&result))
        return CallResult<Reply>{std::move(*undelivered)};
      auto& replies = std::get<std::vector<Reply>>(result);
      if (replies.size() != 1)
        throw RpcError{make_error_code(ecode::logic_error), "expected exactly one reply"};
      return CallResult<Reply>{std::move(replies.front())};
    });
  }

  /**
   * @brief Send `request` without expecting a reply. Resolves once published.
   */
  template <Message Request> async::Future<RpcOutcome> tell(const Request& request) {
    auto envelopes = encode_(request);
    if (!envelopes)
      return async::make_exceptional_future<RpcOutcome>(
          std::make_exception_ptr(RpcError{envelopes.error()}));
    return client_->send_request(std::move(*envelopes), 0);
  }

  const RpcClient& client() const noexcept { return *client_; }
};

// ---------------------------------------------------------------------------------- ProxyProcessor

/**
 * @brief A `Processor` that decodes a `Request`, runs a handler on an executor, and
 *        encodes the `Reply` with the serializer the request came in.
 *
 * When processing fails, replies with a `ServerFailure` describing the exception.
 */
template <Message Request, Message Reply> class ProxyProcessor final : public Processor {
public:
  using HandlerType = std::function<Reply(const Request&)>;

private:
  std::shared_ptr<const EnvelopeCodec> codec_;
  HandlerType handler_;
  async::IoContextBroker executor_;

  static ProcessResult make_result_(Envelope envelope) {
    return ProcessResult{std::move(envelope.body), std::move(envelope.properties)};
  }

public:
  ProxyProcessor(std::shared_ptr<const EnvelopeCodec> codec, HandlerType handler,
                 async::IoContextBroker executor)
      : codec_{std::move(codec)}, handler_{std::move(handler)}, executor_{std::move(executor)} {}

  async::Future<ProcessResult> process(const Delivery& delivery) override {
    auto decoded = codec_->deserialize<Request>(to_span_bytes(delivery.body), delivery.properties);
    if (!decoded)
      throw RpcError{decoded.error(), format("request is not a {}", type_name<Request>())};

    async::Promise<ProcessResult> promise;
    auto future = promise.get_future();
    executor_.execute([codec = codec_, handler = handler_, request = std::move(decoded->message),
                       serializer = std::move(decoded->serializer),
                       promise = std::move(promise)]() mutable {
      try {
        auto envelope = codec->serialize(handler(request), *serializer);
        if (!envelope)
          throw RpcError{envelope.error(), format("failed to encode {}", type_name<Reply>())};
        promise.set_value(make_result_(std::move(*envelope)));
      } catch (...) {
        promise.set_exception(std::current_exception());
      }
    });
    return future;
  }

  ProcessResult on_failure(const Delivery& delivery, std::exception_ptr error) override {
    const auto failure = describe_failure(error);
    WARN("processing {} failed: {}", type_name<Request>(), failure.details);

    auto serializer = codec_->resolve(codec_->serializer_name(delivery.properties));
    auto envelope = codec_->serialize(failure, *serializer);
    if (!envelope) {
      LOG_ERR("failed to encode failure reply: {}", envelope.error().message());
      return ProcessResult{};
    }
    return make_result_(std::move(*envelope));
  }
};

} // namespace courier::mq
