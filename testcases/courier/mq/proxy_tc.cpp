#include "courier/mq/loopback-broker.hpp"
#include "courier/mq/proxy.hpp"

#include "test-support.hpp"

#include "stdinc.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <stdexcept>

namespace courier::mq::tests {

using testing::DoubleRequest;
using testing::DoubleResponse;
using testing::drain;

namespace {
  using DoubleProcessor = ProxyProcessor<DoubleRequest, DoubleResponse>;

  /**
   * Servers and a client for the "doubler" endpoint, over one in-process broker.
   * Requests with a negative value fail on the server.
   */
  struct Rig {
    boost::asio::io_context io_context{};
    LoopbackBroker broker{io_context};
    async::IoContextBroker executor = async::make_execution_broker(io_context);
    std::shared_ptr<SerializerRegistry> registry = SerializerRegistry::make_default();
    std::shared_ptr<const EnvelopeCodec> codec =
        std::make_shared<const EnvelopeCodec>(registry, CodecConfig{});
    EndpointConfig endpoint = resolve_endpoint("doubler");
    std::shared_ptr<std::atomic<int>> processed = std::make_shared<std::atomic<int>>(0);
    std::vector<std::shared_ptr<RpcServer>> servers{};
    std::shared_ptr<RpcClient> client{};

    std::shared_ptr<RpcServer> add_server() {
      auto processor = std::make_shared<DoubleProcessor>(
          codec,
          [processed = processed](const DoubleRequest& request) {
            ++*processed;
            if (request.value < 0)
              throw std::domain_error{"negative value"};
            return DoubleResponse{request.value * 2};
          },
          executor);
      // Every server consumes its own queue, bound to the fanout exchange
      auto server = std::make_shared<RpcServer>(io_context, broker.open_channel(), processor,
                                                make_server_config(resolve_endpoint("doubler")));
      server->start();
      servers.push_back(server);
      return server;
    }

    RpcProxy make_proxy(RpcClient::Config config,
                        std::shared_ptr<const Serializer> serializer = nullptr) {
      client = std::make_shared<RpcClient>(io_context, broker.open_channel(), std::move(config));
      client->start();
      drain(io_context);
      return RpcProxy{client, codec, executor, std::move(serializer)};
    }

    RpcProxy make_proxy() { return make_proxy(make_client_config(endpoint)); }
  };
} // namespace

CATCH_TEST_CASE("RpcProxy", "[proxy]") {
  Rig rig;
  rig.add_server();

  CATCH_SECTION("call resolves with the decoded reply") {
    auto proxy = rig.make_proxy();
    CATCH_REQUIRE(rig.client->state() == ConnectionState::CONNECTED);

    auto future = proxy.call<DoubleResponse>(DoubleRequest{21});
    drain(rig.io_context);
    CATCH_REQUIRE(future.is_ready());
    auto result = future.get();
    CATCH_REQUIRE(std::get<DoubleResponse>(result).value == 42);
    CATCH_REQUIRE(rig.client->pending_count() == 0);
  }

  CATCH_SECTION("requests may use the binary serializer") {
    auto proxy = rig.make_proxy(make_client_config(rig.endpoint),
                                rig.registry->find(SerializerRegistry::k_binary));
    auto future = proxy.call<DoubleResponse>(DoubleRequest{20});
    drain(rig.io_context);
    CATCH_REQUIRE(std::get<DoubleResponse>(future.get()).value == 40);
  }

  CATCH_SECTION("gather collects a reply from every subscriber") {
    rig.add_server();
    auto proxy = rig.make_proxy();

    auto future = proxy.gather<DoubleResponse>(DoubleRequest{5}, 2);
    drain(rig.io_context);
    CATCH_REQUIRE(future.is_ready());
    auto result = future.get();
    const auto& replies = std::get<std::vector<DoubleResponse>>(result);
    CATCH_REQUIRE(replies.size() == 2);
    CATCH_REQUIRE(replies[0].value == 10);
    CATCH_REQUIRE(replies[1].value == 10);
    CATCH_REQUIRE(*rig.processed == 2);
  }

  CATCH_SECTION("an unroutable request resolves as undelivered") {
    RpcClient::Config config;
    config.exchange = "amq.direct";
    config.routing_key = "nobody-listens";
    auto proxy = rig.make_proxy(config);

    auto future = proxy.call<DoubleResponse>(DoubleRequest{1});
    drain(rig.io_context);
    CATCH_REQUIRE(future.is_ready());
    auto result = future.get();
    const auto& undelivered = std::get<Undelivered>(result);
    CATCH_REQUIRE(undelivered.message.reply_code == 312);
    CATCH_REQUIRE(undelivered.message.reply_text == "NO_ROUTE");
    CATCH_REQUIRE(*rig.processed == 0);
  }

  CATCH_SECTION("a failure on the server is raised on the client") {
    auto proxy = rig.make_proxy();
    auto future = proxy.call<DoubleResponse>(DoubleRequest{-1});
    drain(rig.io_context);
    CATCH_REQUIRE(future.is_ready());
    try {
      future.get();
      CATCH_FAIL("expected a RemoteProcessingFailure");
    } catch (const RemoteProcessingFailure& e) {
      CATCH_REQUIRE(e.message() == "negative value");
      CATCH_REQUIRE(e.details().find("domain_error") != std::string_view::npos);
    }
  }

  CATCH_SECTION("a reply of the wrong type is a local error") {
    auto proxy = rig.make_proxy();
    auto future = proxy.call<testing::Everything>(DoubleRequest{3});
    drain(rig.io_context);
    CATCH_REQUIRE_THROWS_AS(future.get(), RpcError);
  }

  CATCH_SECTION("tell publishes without waiting for a reply") {
    auto proxy = rig.make_proxy();
    auto future = proxy.tell(DoubleRequest{8});
    drain(rig.io_context);
    CATCH_REQUIRE(future.is_ready());
    CATCH_REQUIRE(std::get<Response>(future.get()).deliveries.empty());
    CATCH_REQUIRE(*rig.processed == 1);
    CATCH_REQUIRE(rig.client->pending_count() == 0);
  }

  CATCH_SECTION("a lost connection abandons pending requests") {
    auto proxy = rig.make_proxy();

    // Only one of the two replies can ever arrive
    auto orphan = proxy.gather<DoubleResponse>(DoubleRequest{2}, 2);
    drain(rig.io_context);
    CATCH_REQUIRE(rig.client->pending_count() == 1);

    rig.broker.disconnect();
    drain(rig.io_context);
    CATCH_REQUIRE(rig.client->state() == ConnectionState::DISCONNECTED);
    CATCH_REQUIRE(rig.client->pending_count() == 0);

    auto rejected = proxy.call<DoubleResponse>(DoubleRequest{2});
    drain(rig.io_context);
    CATCH_REQUIRE_THROWS_AS(rejected.get(), RpcError);

    rig.broker.reconnect();
    drain(rig.io_context);
    CATCH_REQUIRE(rig.client->state() == ConnectionState::CONNECTED);

    auto future = proxy.call<DoubleResponse>(DoubleRequest{3});
    drain(rig.io_context);
    CATCH_REQUIRE(std::get<DoubleResponse>(future.get()).value == 6);
    CATCH_REQUIRE(orphan.wait_for(10ms) == std::future_status::timeout);
  }
}

} // namespace courier::mq::tests
