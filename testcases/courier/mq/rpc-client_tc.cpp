#include "courier/mq/rpc-client.hpp"
#include "courier/mq/rpc-error.hpp"

#include "test-support.hpp"

#include "stdinc.hpp"

#include <catch2/catch.hpp>

namespace courier::mq::tests {

using testing::drain;
using testing::FakeTransport;
using testing::make_reply;

namespace {
  std::vector<Envelope> make_request(std::string_view body) {
    std::vector<Envelope> envelopes(1);
    envelopes.front().body = make_send_buffer(body);
    return envelopes;
  }

  std::error_code error_of(async::Future<RpcOutcome>& future) {
    try {
      future.get();
    } catch (const RpcError& e) {
      return e.code();
    }
    return {};
  }
} // namespace

CATCH_TEST_CASE("RpcClient", "[rpc-client]") {
  boost::asio::io_context io_context;
  auto transport = std::make_shared<FakeTransport>();

  RpcClient::Config config;
  config.exchange = "calculator";
  config.routing_key = "add";
  config.channel.prefetch_count = 4;

  auto client = std::make_shared<RpcClient>(io_context, transport, config);
  client->start();
  CATCH_REQUIRE(transport->is_open);

  CATCH_SECTION("requests fail while not connected") {
    auto future = client->send_request(make_request("a"), 1);
    drain(io_context);
    CATCH_REQUIRE(future.is_ready());
    CATCH_REQUIRE(error_of(future) == make_error_code(ecode::not_connected));
    CATCH_REQUIRE(transport->published.empty());
  }

  CATCH_SECTION("a failed channel setup stays disconnected") {
    transport->declare_queue_error = make_error_code(ecode::resource_locked);
    transport->connect();
    drain(io_context);
    CATCH_REQUIRE(client->state() == ConnectionState::DISCONNECTED);
    CATCH_REQUIRE(transport->consumed.empty());

    auto future = client->send_request(make_request("a"), 1);
    drain(io_context);
    CATCH_REQUIRE(error_of(future) == make_error_code(ecode::not_connected));
  }

  CATCH_SECTION("connected") {
    auto ready = client->when_connected();
    transport->connect();
    drain(io_context);
    CATCH_REQUIRE(ready.is_ready());
    CATCH_REQUIRE(client->state() == ConnectionState::CONNECTED);

    CATCH_SECTION("declares an exclusive reply queue, and consumes it") {
      CATCH_REQUIRE(transport->qos.size() == 1);
      CATCH_REQUIRE(transport->qos[0].prefetch_count == 4);
      CATCH_REQUIRE(transport->queues.size() == 1);
      CATCH_REQUIRE(transport->queues[0].name.empty());
      CATCH_REQUIRE(transport->queues[0].exclusive);
      CATCH_REQUIRE(transport->queues[0].autodelete);
      CATCH_REQUIRE(transport->consumed == std::vector<std::string>{"amq.gen-reply"});
      CATCH_REQUIRE(client->reply_queue_name() == "amq.gen-reply");
    }

    CATCH_SECTION("stamps each request with a fresh correlation id and the reply queue") {
      auto f1 = client->send_request(make_request("a"), 1);
      auto f2 = client->send_request(make_request("b"), 1);
      drain(io_context);

      CATCH_REQUIRE(transport->published.size() == 2);
      const auto& first = transport->published[0];
      CATCH_REQUIRE(first.exchange == "calculator");
      CATCH_REQUIRE(first.routing_key == "add");
      CATCH_REQUIRE(first.mandatory);
      CATCH_REQUIRE(!first.immediate);
      CATCH_REQUIRE(first.envelope.properties.correlation_id == "1");
      CATCH_REQUIRE(first.envelope.properties.reply_to == "amq.gen-reply");
      CATCH_REQUIRE(transport->published[1].envelope.properties.correlation_id == "2");
      CATCH_REQUIRE(client->pending_count() == 2);

      transport->deliver(make_reply(7, "2", "two"));
      drain(io_context);
      CATCH_REQUIRE(transport->acked == std::vector<uint64_t>{7});
      CATCH_REQUIRE(!f1.is_ready());
      CATCH_REQUIRE(f2.is_ready());

      auto outcome = f2.get();
      const auto& response = std::get<Response>(outcome);
      CATCH_REQUIRE(response.deliveries.size() == 1);
      CATCH_REQUIRE(str(response.deliveries[0].body) == "two");
      CATCH_REQUIRE(client->pending_count() == 1);
    }

    CATCH_SECTION("gathers several replies for one request") {
      auto future = client->send_request(make_request("a"), 2);
      drain(io_context);
      transport->deliver(make_reply(1, "1", "x"));
      drain(io_context);
      CATCH_REQUIRE(!future.is_ready());
      transport->deliver(make_reply(2, "1", "y"));
      drain(io_context);
      CATCH_REQUIRE(future.is_ready());
      CATCH_REQUIRE(std::get<Response>(future.get()).deliveries.size() == 2);
    }

    CATCH_SECTION("acknowledges and drops replies nobody is waiting for") {
      transport->deliver(make_reply(3, "42"));
      drain(io_context);
      CATCH_REQUIRE(transport->acked == std::vector<uint64_t>{3});
      CATCH_REQUIRE(client->pending_count() == 0);
    }

    CATCH_SECTION("expecting no replies resolves once published") {
      auto future = client->send_request(make_request("a"), 0);
      drain(io_context);
      CATCH_REQUIRE(future.is_ready());
      CATCH_REQUIRE(std::get<Response>(future.get()).deliveries.empty());
      CATCH_REQUIRE(transport->published.size() == 1);
      CATCH_REQUIRE(transport->published[0].envelope.properties.correlation_id.empty());
      CATCH_REQUIRE(client->pending_count() == 0);
    }

    CATCH_SECTION("expecting replies to no envelopes is an error") {
      auto future = client->send_request({}, 1);
      drain(io_context);
      CATCH_REQUIRE(error_of(future) == make_error_code(ecode::argument_error));
    }

    CATCH_SECTION("a returned request resolves as undelivered") {
      auto future = client->send_request(make_request("a"), 2);
      drain(io_context);

      ReturnedMessage returned;
      returned.reply_code = 312;
      returned.reply_text = "NO_ROUTE";
      returned.properties = transport->published[0].envelope.properties;
      transport->return_message(returned);
      drain(io_context);

      CATCH_REQUIRE(future.is_ready());
      auto outcome = future.get();
      CATCH_REQUIRE(std::get<Undelivered>(outcome).message.reply_code == 312);
      CATCH_REQUIRE(client->pending_count() == 0);
    }

    CATCH_SECTION("a publish failure fails the request") {
      transport->publish_error = make_error_code(ecode::not_connected);
      auto future = client->send_request(make_request("a"), 1);
      drain(io_context);
      CATCH_REQUIRE(error_of(future) == make_error_code(ecode::not_connected));
      CATCH_REQUIRE(client->pending_count() == 0);
    }

    CATCH_SECTION("a disconnect abandons pending requests") {
      auto future = client->send_request(make_request("a"), 1);
      drain(io_context);
      CATCH_REQUIRE(client->pending_count() == 1);

      transport->disconnect();
      drain(io_context);
      CATCH_REQUIRE(client->state() == ConnectionState::DISCONNECTED);
      CATCH_REQUIRE(client->pending_count() == 0);

      // The reply may still arrive, but is dropped
      transport->deliver(make_reply(9, "1"));
      drain(io_context);
      CATCH_REQUIRE(future.wait_for(10ms) == std::future_status::timeout);

      transport->connect();
      drain(io_context);
      CATCH_REQUIRE(client->state() == ConnectionState::CONNECTED);
      CATCH_REQUIRE(transport->consumed.size() == 2);

      auto next = client->send_request(make_request("b"), 1);
      drain(io_context);
      CATCH_REQUIRE(transport->published.back().envelope.properties.correlation_id == "2");
    }
  }
}

CATCH_TEST_CASE("RpcClient reply queue", "[rpc-client]") {
  boost::asio::io_context io_context;
  auto transport = std::make_shared<FakeTransport>();

  RpcClient::Config config;
  QueueParameters reply_queue;
  reply_queue.name = "replies";
  reply_queue.durable = true;
  config.reply_queue = reply_queue;

  auto client = std::make_shared<RpcClient>(io_context, transport, config);
  client->start();
  transport->connect();
  drain(io_context);

  CATCH_REQUIRE(transport->queues.size() == 1);
  CATCH_REQUIRE(transport->queues[0].durable);
  CATCH_REQUIRE(!transport->queues[0].exclusive);
  CATCH_REQUIRE(client->reply_queue_name() == "replies");

  client->stop();
  drain(io_context);
  CATCH_REQUIRE(!transport->is_open);
  CATCH_REQUIRE(client->state() == ConnectionState::DISCONNECTED);
}

} // namespace courier::mq::tests
