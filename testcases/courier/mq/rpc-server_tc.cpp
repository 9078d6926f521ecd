#include "courier/mq/rpc-server.hpp"

#include "test-support.hpp"

#include "stdinc.hpp"

#include <catch2/catch.hpp>

namespace courier::mq::tests {

using testing::drain;
using testing::FakeTransport;

namespace {
  ProcessResult make_result(std::string_view body) {
    ProcessResult result;
    result.payload = make_send_buffer(body);
    result.properties = MessageProperties{};
    result.properties->content_type = "reply";
    return result;
  }

  /**
   * Processes with a swappable handler, and records what failed.
   */
  struct ScriptedProcessor final : public Processor {
    std::function<async::Future<ProcessResult>(const Delivery&)> handler{};
    std::vector<std::string> failures{};

    async::Future<ProcessResult> process(const Delivery& delivery) override {
      return handler(delivery);
    }

    ProcessResult on_failure(const Delivery&, std::exception_ptr error) override {
      try {
        std::rethrow_exception(error);
      } catch (const std::exception& e) {
        failures.emplace_back(e.what());
      }
      return make_result("failed");
    }
  };

  /**
   * Fails every request, and then fails to describe the failure with something that is not a
   * `std::exception`.
   */
  struct ThrowingFailureProcessor final : public Processor {
    int failures = 0;

    async::Future<ProcessResult> process(const Delivery&) override {
      throw std::runtime_error{"bad request"};
    }

    ProcessResult on_failure(const Delivery&, std::exception_ptr) override {
      ++failures;
      throw 42;
    }
  };

  Delivery make_request(uint64_t delivery_tag, std::string reply_to = "amq.gen-client") {
    Delivery delivery;
    delivery.delivery_tag = delivery_tag;
    delivery.properties.correlation_id = std::to_string(delivery_tag);
    delivery.properties.reply_to = std::move(reply_to);
    delivery.body = make_send_buffer("ping");
    return delivery;
  }
} // namespace

CATCH_TEST_CASE("RpcServer", "[rpc-server]") {
  boost::asio::io_context io_context;
  auto transport = std::make_shared<FakeTransport>();
  auto processor = std::make_shared<ScriptedProcessor>();
  processor->handler = [](const Delivery&) { return async::make_ready_future(make_result("pong")); };

  RpcServer::Config config;
  config.exchange = ExchangeParameters{"calculator", "fanout"};
  config.queue = QueueParameters{"calculator-1"};
  config.routing_key = "calculator";
  config.channel.prefetch_count = 2;

  auto server = std::make_shared<RpcServer>(io_context, transport, processor, config);
  server->start();
  transport->connect();
  drain(io_context);
  CATCH_REQUIRE(server->state() == ConnectionState::CONNECTED);

  CATCH_SECTION("declares, binds and consumes its queue") {
    CATCH_REQUIRE(transport->exchanges.size() == 1);
    CATCH_REQUIRE(transport->exchanges[0].type == "fanout");
    CATCH_REQUIRE(transport->queues.size() == 1);
    CATCH_REQUIRE(transport->bindings ==
                  std::vector<std::string>{"calculator/calculator-1/calculator"});
    CATCH_REQUIRE(transport->qos.size() == 1);
    CATCH_REQUIRE(transport->qos[0].prefetch_count == 2);
    CATCH_REQUIRE(transport->consumed == std::vector<std::string>{"calculator-1"});
    CATCH_REQUIRE(server->queue_name() == "calculator-1");
  }

  CATCH_SECTION("replies to the reply_to queue through the default exchange") {
    transport->deliver(make_request(5));
    drain(io_context);

    CATCH_REQUIRE(transport->acked == std::vector<uint64_t>{5});
    CATCH_REQUIRE(transport->published.size() == 1);
    const auto& reply = transport->published[0];
    CATCH_REQUIRE(reply.exchange.empty());
    CATCH_REQUIRE(reply.routing_key == "amq.gen-client");
    CATCH_REQUIRE(!reply.mandatory);
    CATCH_REQUIRE(!reply.immediate);
    CATCH_REQUIRE(reply.envelope.properties.correlation_id == "5");
    CATCH_REQUIRE(reply.envelope.properties.reply_to.empty());
    CATCH_REQUIRE(reply.envelope.properties.content_type == "reply");
    CATCH_REQUIRE(str(reply.envelope.body) == "pong");
  }

  CATCH_SECTION("sends nothing when the processor has no reply") {
    processor->handler = [](const Delivery&) { return async::make_ready_future(ProcessResult{}); };
    transport->deliver(make_request(1));
    drain(io_context);
    CATCH_REQUIRE(transport->acked.size() == 1);
    CATCH_REQUIRE(transport->published.empty());
  }

  CATCH_SECTION("sends nothing when the request has no reply_to") {
    transport->deliver(make_request(1, ""));
    drain(io_context);
    CATCH_REQUIRE(transport->acked.size() == 1);
    CATCH_REQUIRE(transport->published.empty());
  }

  CATCH_SECTION("replies once an asynchronous result is ready") {
    async::Promise<ProcessResult> pending;
    auto future = pending.get_future();
    processor->handler = [&future](const Delivery&) { return std::move(future); };

    transport->deliver(make_request(3));
    drain(io_context);
    CATCH_REQUIRE(transport->published.empty());

    pending.set_value(make_result("later"));
    drain(io_context);
    CATCH_REQUIRE(transport->published.size() == 1);
    CATCH_REQUIRE(str(transport->published[0].envelope.body) == "later");
    CATCH_REQUIRE(transport->published[0].envelope.properties.correlation_id == "3");
  }

  CATCH_SECTION("a processor that throws replies with its failure result") {
    processor->handler = [](const Delivery&) -> async::Future<ProcessResult> {
      throw std::runtime_error{"bad request"};
    };
    transport->deliver(make_request(4));
    drain(io_context);
    CATCH_REQUIRE(processor->failures == std::vector<std::string>{"bad request"});
    CATCH_REQUIRE(transport->published.size() == 1);
    CATCH_REQUIRE(str(transport->published[0].envelope.body) == "failed");
    CATCH_REQUIRE(transport->published[0].envelope.properties.correlation_id == "4");
  }

  CATCH_SECTION("a failure handler that throws sends no reply, and nothing escapes") {
    auto throwing = std::make_shared<ThrowingFailureProcessor>();
    auto other = std::make_shared<FakeTransport>();
    auto other_server = std::make_shared<RpcServer>(io_context, other, throwing, config);
    other_server->start();
    other->connect();
    drain(io_context);

    other->deliver(make_request(11));
    CATCH_REQUIRE_NOTHROW(drain(io_context));
    CATCH_REQUIRE(other->acked == std::vector<uint64_t>{11});
    CATCH_REQUIRE(other->published.empty());
    CATCH_REQUIRE(throwing->failures == 1);

    // The server keeps serving
    other->deliver(make_request(12));
    CATCH_REQUIRE_NOTHROW(drain(io_context));
    CATCH_REQUIRE(throwing->failures == 2);
  }

  CATCH_SECTION("a failed future replies with the failure result") {
    processor->handler = [](const Delivery&) {
      return async::make_exceptional_future<ProcessResult>(
          std::make_exception_ptr(std::logic_error{"division by zero"}));
    };
    transport->deliver(make_request(6));
    drain(io_context);
    CATCH_REQUIRE(processor->failures == std::vector<std::string>{"division by zero"});
    CATCH_REQUIRE(transport->published.size() == 1);
    CATCH_REQUIRE(str(transport->published[0].envelope.body) == "failed");
  }

  CATCH_SECTION("results that are ready after a disconnect are dropped") {
    async::Promise<ProcessResult> pending;
    auto future = pending.get_future();
    processor->handler = [&future](const Delivery&) { return std::move(future); };

    transport->deliver(make_request(8));
    drain(io_context);
    transport->disconnect();
    drain(io_context);
    CATCH_REQUIRE(server->state() == ConnectionState::DISCONNECTED);

    pending.set_value(make_result("late"));
    drain(io_context);
    CATCH_REQUIRE(transport->published.empty());
  }

  CATCH_SECTION("deliveries while disconnected are ignored") {
    transport->disconnect();
    drain(io_context);
    transport->deliver(make_request(2));
    drain(io_context);
    CATCH_REQUIRE(transport->acked.empty());
    CATCH_REQUIRE(transport->published.empty());
  }
}

CATCH_TEST_CASE("RpcServer on the default exchange", "[rpc-server]") {
  boost::asio::io_context io_context;
  auto transport = std::make_shared<FakeTransport>();
  auto processor = std::make_shared<ScriptedProcessor>();

  RpcServer::Config config;
  config.exchange = ExchangeParameters{""};
  config.queue = QueueParameters{"work"};

  auto server = std::make_shared<RpcServer>(io_context, transport, processor, config);
  server->start();
  transport->connect();
  drain(io_context);

  CATCH_REQUIRE(server->state() == ConnectionState::CONNECTED);
  CATCH_REQUIRE(transport->exchanges.empty());
  CATCH_REQUIRE(transport->bindings.empty());
  CATCH_REQUIRE(transport->consumed == std::vector<std::string>{"work"});
}

} // namespace courier::mq::tests
