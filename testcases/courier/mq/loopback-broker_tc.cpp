#include "courier/mq/loopback-broker.hpp"
#include "courier/utils/error-codes.hpp"

#include "test-support.hpp"

#include "stdinc.hpp"

#include <catch2/catch.hpp>

namespace courier::mq::tests {

using testing::drain;

namespace {
  /**
   * Records every event, and acks nothing unless asked to.
   */
  struct RecordingListener final : public TransportListener {
    int connected = 0;
    int disconnected = 0;
    std::vector<Delivery> deliveries{};
    std::vector<ReturnedMessage> returned{};

    void on_connected() override { ++connected; }
    void on_disconnected() override { ++disconnected; }
    void on_delivery(Delivery delivery) override { deliveries.push_back(std::move(delivery)); }
    void on_returned(ReturnedMessage message) override { returned.push_back(std::move(message)); }
  };

  Envelope make_envelope(std::string_view body) {
    Envelope envelope;
    envelope.body = make_send_buffer(body);
    envelope.properties.correlation_id = std::string{body};
    return envelope;
  }
} // namespace

CATCH_TEST_CASE("LoopbackBroker", "[loopback-broker]") {
  boost::asio::io_context io_context;
  LoopbackBroker broker{io_context};

  auto listener = std::make_shared<RecordingListener>();
  auto channel = broker.open_channel();
  channel->open(listener);
  drain(io_context);
  CATCH_REQUIRE(listener->connected == 1);

  CATCH_SECTION("the default exchange routes by queue name") {
    auto queue = channel->declare_queue(QueueParameters{"work"});
    CATCH_REQUIRE(queue.value() == "work");
    CATCH_REQUIRE(!channel->publish("", "work", make_envelope("a"), false, false));
    CATCH_REQUIRE(broker.queue_depth("work") == 1);

    CATCH_REQUIRE(channel->consume("work").has_value());
    drain(io_context);
    CATCH_REQUIRE(listener->deliveries.size() == 1);
    CATCH_REQUIRE(str(listener->deliveries[0].body) == "a");
    CATCH_REQUIRE(broker.queue_depth("work") == 0);
    CATCH_REQUIRE(broker.unacked_count() == 1);

    CATCH_REQUIRE(!channel->ack(listener->deliveries[0].delivery_tag));
    CATCH_REQUIRE(broker.unacked_count() == 0);
    CATCH_REQUIRE(channel->ack(listener->deliveries[0].delivery_tag) ==
                  make_error_code(ecode::precondition_failed));
  }

  CATCH_SECTION("direct exchanges match the routing key, fanout ignores it") {
    CATCH_REQUIRE(!channel->declare_exchange(ExchangeParameters{"d", "direct"}));
    CATCH_REQUIRE(!channel->declare_exchange(ExchangeParameters{"f", "fanout"}));
    CATCH_REQUIRE(channel->declare_queue(QueueParameters{"q1"}));
    CATCH_REQUIRE(channel->declare_queue(QueueParameters{"q2"}));
    CATCH_REQUIRE(!channel->bind("d", "q1", "one"));
    CATCH_REQUIRE(!channel->bind("d", "q2", "two"));
    CATCH_REQUIRE(!channel->bind("f", "q1", "ignored"));
    CATCH_REQUIRE(!channel->bind("f", "q2", "ignored"));

    CATCH_REQUIRE(!channel->publish("d", "two", make_envelope("x"), true, false));
    CATCH_REQUIRE(broker.queue_depth("q1") == 0);
    CATCH_REQUIRE(broker.queue_depth("q2") == 1);

    CATCH_REQUIRE(!channel->publish("f", "anything", make_envelope("y"), true, false));
    CATCH_REQUIRE(broker.queue_depth("q1") == 1);
    CATCH_REQUIRE(broker.queue_depth("q2") == 2);

    drain(io_context);
    CATCH_REQUIRE(listener->returned.empty());
  }

  CATCH_SECTION("unroutable mandatory messages are returned") {
    CATCH_REQUIRE(!channel->declare_exchange(ExchangeParameters{"d", "direct"}));
    CATCH_REQUIRE(!channel->publish("d", "nobody", make_envelope("lost"), true, false));
    CATCH_REQUIRE(!channel->publish("d", "nobody", make_envelope("dropped"), false, false));
    drain(io_context);
    CATCH_REQUIRE(listener->returned.size() == 1);
    CATCH_REQUIRE(listener->returned[0].reply_code == 312);
    CATCH_REQUIRE(listener->returned[0].properties.correlation_id == "lost");
  }

  CATCH_SECTION("immediate messages need a consumer") {
    CATCH_REQUIRE(channel->declare_queue(QueueParameters{"idle"}));
    CATCH_REQUIRE(!channel->publish("", "idle", make_envelope("now"), false, true));
    drain(io_context);
    CATCH_REQUIRE(listener->returned.size() == 1);
    CATCH_REQUIRE(listener->returned[0].reply_code == 313);
    CATCH_REQUIRE(broker.queue_depth("idle") == 0);
  }

  CATCH_SECTION("publishing to a missing exchange fails") {
    CATCH_REQUIRE(channel->publish("nope", "", make_envelope("x"), true, false) ==
                  make_error_code(ecode::unknown_exchange));
  }

  CATCH_SECTION("declarations are checked") {
    CATCH_REQUIRE(channel->declare_exchange(ExchangeParameters{"missing", "direct", true}) ==
                  make_error_code(ecode::unknown_exchange));
    CATCH_REQUIRE(!channel->declare_exchange(ExchangeParameters{"amq.direct", "direct", true}));
    CATCH_REQUIRE(channel->declare_exchange(ExchangeParameters{"amq.fanout", "direct"}) ==
                  make_error_code(ecode::precondition_failed));
    CATCH_REQUIRE(channel->declare_exchange(ExchangeParameters{"t", "topic"}) ==
                  make_error_code(ecode::argument_error));

    QueueParameters passive{"missing"};
    passive.passive = true;
    CATCH_REQUIRE(channel->declare_queue(passive).error() == make_error_code(ecode::unknown_queue));

    CATCH_REQUIRE(channel->declare_queue(QueueParameters{"q"}));
    QueueParameters durable{"q"};
    durable.durable = true;
    CATCH_REQUIRE(channel->declare_queue(durable).error() ==
                  make_error_code(ecode::precondition_failed));

    CATCH_REQUIRE(channel->bind("amq.direct", "missing", "k") ==
                  make_error_code(ecode::unknown_queue));
  }

  CATCH_SECTION("exclusive queues are named by the broker, and private to their channel") {
    QueueParameters parameters;
    parameters.exclusive = true;
    parameters.autodelete = true;
    auto queue = channel->declare_queue(parameters);
    CATCH_REQUIRE(queue.has_value());
    CATCH_REQUIRE(queue->starts_with("amq.gen-"));

    auto other = broker.open_channel();
    other->open(std::make_shared<RecordingListener>());
    CATCH_REQUIRE(other->consume(*queue).error() == make_error_code(ecode::resource_locked));

    channel->close();
    CATCH_REQUIRE(!broker.has_queue(*queue));
    CATCH_REQUIRE(channel->publish("", "q", make_envelope("x"), false, false) ==
                  make_error_code(ecode::channel_closed));
  }

  CATCH_SECTION("consumers take turns, within their prefetch") {
    auto listener2 = std::make_shared<RecordingListener>();
    auto channel2 = broker.open_channel();
    channel2->open(listener2);
    drain(io_context);

    CATCH_REQUIRE(channel->declare_queue(QueueParameters{"rr"}));
    CATCH_REQUIRE(!channel->set_qos(ChannelParameters{1, false}));
    CATCH_REQUIRE(!channel2->set_qos(ChannelParameters{1, false}));
    CATCH_REQUIRE(channel->consume("rr"));
    CATCH_REQUIRE(channel2->consume("rr"));
    CATCH_REQUIRE(broker.consumer_count("rr") == 2);

    for (auto body : {"1", "2", "3"})
      CATCH_REQUIRE(!channel->publish("", "rr", make_envelope(body), false, false));
    drain(io_context);

    CATCH_REQUIRE(listener->deliveries.size() == 1);
    CATCH_REQUIRE(listener2->deliveries.size() == 1);
    CATCH_REQUIRE(broker.queue_depth("rr") == 1);

    CATCH_REQUIRE(!channel2->ack(listener2->deliveries[0].delivery_tag));
    drain(io_context);
    CATCH_REQUIRE(listener2->deliveries.size() == 2);
    CATCH_REQUIRE(str(listener2->deliveries[1].body) == "3");
  }

  CATCH_SECTION("autodelete queues go with their last consumer") {
    QueueParameters parameters{"temp"};
    parameters.autodelete = true;
    CATCH_REQUIRE(channel->declare_queue(parameters));
    CATCH_REQUIRE(channel->consume("temp"));
    channel->close();
    CATCH_REQUIRE(!broker.has_queue("temp"));
  }

  CATCH_SECTION("nothing is delivered while the connection is down") {
    auto listener2 = std::make_shared<RecordingListener>();
    auto channel2 = broker.open_channel();
    channel2->open(listener2);
    drain(io_context);

    CATCH_REQUIRE(channel->declare_queue(QueueParameters{"shared"}));
    CATCH_REQUIRE(channel->consume("shared"));
    CATCH_REQUIRE(channel2->consume("shared"));
    CATCH_REQUIRE(!channel->publish("", "shared", make_envelope("m1"), false, false));
    CATCH_REQUIRE(!channel->publish("", "shared", make_envelope("m2"), false, false));
    drain(io_context);
    CATCH_REQUIRE(listener->deliveries.size() == 1);
    CATCH_REQUIRE(listener2->deliveries.size() == 1);

    broker.disconnect();
    drain(io_context);
    CATCH_REQUIRE(listener->disconnected == 1);
    CATCH_REQUIRE(listener2->disconnected == 1);
    CATCH_REQUIRE(listener->deliveries.size() == 1);
    CATCH_REQUIRE(listener2->deliveries.size() == 1);
    CATCH_REQUIRE(broker.queue_depth("shared") == 2);
    CATCH_REQUIRE(broker.unacked_count() == 0);

    broker.reconnect();
    drain(io_context);
    CATCH_REQUIRE(channel2->consume("shared"));
    drain(io_context);
    CATCH_REQUIRE(listener2->deliveries.size() == 3);
    CATCH_REQUIRE(listener2->deliveries[1].redelivered);
    CATCH_REQUIRE(listener2->deliveries[2].redelivered);
    CATCH_REQUIRE(str(listener2->deliveries[1].body) == "m1");
    CATCH_REQUIRE(str(listener2->deliveries[2].body) == "m2");
  }

  CATCH_SECTION("a disconnect requeues unacknowledged messages as redelivered") {
    auto other = broker.open_channel();
    auto other_listener = std::make_shared<RecordingListener>();
    other->open(other_listener);

    CATCH_REQUIRE(channel->declare_queue(QueueParameters{"durable-work"}));
    CATCH_REQUIRE(channel->consume("durable-work"));
    CATCH_REQUIRE(!channel->publish("", "durable-work", make_envelope("m"), false, false));
    drain(io_context);
    CATCH_REQUIRE(listener->deliveries.size() == 1);
    CATCH_REQUIRE(!listener->deliveries[0].redelivered);

    broker.disconnect();
    drain(io_context);
    CATCH_REQUIRE(!broker.is_connected());
    CATCH_REQUIRE(listener->disconnected == 1);
    CATCH_REQUIRE(other_listener->disconnected == 1);
    CATCH_REQUIRE(broker.queue_depth("durable-work") == 1);
    CATCH_REQUIRE(broker.consumer_count("durable-work") == 0);
    CATCH_REQUIRE(channel->publish("", "durable-work", make_envelope("n"), false, false) ==
                  make_error_code(ecode::not_connected));

    broker.reconnect();
    drain(io_context);
    CATCH_REQUIRE(listener->connected == 2);
    CATCH_REQUIRE(channel->consume("durable-work"));
    drain(io_context);
    CATCH_REQUIRE(listener->deliveries.size() == 2);
    CATCH_REQUIRE(listener->deliveries[1].redelivered);
    CATCH_REQUIRE(str(listener->deliveries[1].body) == "m");
  }
}

} // namespace courier::mq::tests
