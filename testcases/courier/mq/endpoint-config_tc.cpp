#include "courier/mq/endpoint-config.hpp"
#include "courier/mq/properties.hpp"
#include "courier/mq/rpc-client.hpp"
#include "courier/mq/rpc-server.hpp"

#include "stdinc.hpp"

#include <catch2/catch.hpp>

namespace courier::mq::tests {

CATCH_TEST_CASE("EndpointConfig", "[endpoint-config]") {
  CATCH_SECTION("defaults") {
    const auto endpoint = resolve_endpoint("calculator");
    CATCH_REQUIRE(endpoint.name == "calculator");

    CATCH_REQUIRE(endpoint.exchange.name == "calculator");
    CATCH_REQUIRE(endpoint.exchange.type == "fanout");
    CATCH_REQUIRE(endpoint.exchange.durable);
    CATCH_REQUIRE(!endpoint.exchange.autodelete);
    CATCH_REQUIRE(!endpoint.exchange.passive);

    CATCH_REQUIRE(endpoint.queue.name.starts_with("calculator-"));
    CATCH_REQUIRE(endpoint.queue.name.size() == std::string_view{"calculator-"}.size() + 36);
    CATCH_REQUIRE(endpoint.queue.durable);
    CATCH_REQUIRE(endpoint.queue.autodelete);
    CATCH_REQUIRE(!endpoint.queue.passive);
    CATCH_REQUIRE(!endpoint.queue.exclusive);

    CATCH_REQUIRE(endpoint.channel.prefetch_count == 1);
    CATCH_REQUIRE(!endpoint.channel.prefetch_is_global);
  }

  CATCH_SECTION("randomized queue names are fresh on every resolve") {
    CATCH_REQUIRE(resolve_endpoint("x").queue.name != resolve_endpoint("x").queue.name);
  }

  CATCH_SECTION("overrides from properties") {
    PropertyMap properties{{"courier.proxies.calculator.exchange.name", "amq.direct"},
                           {"courier.proxies.calculator.exchange.type", "direct"},
                           {"courier.proxies.calculator.exchange.passive", "yes"},
                           {"courier.proxies.calculator.queue.name", "calc"},
                           {"courier.proxies.calculator.queue.randomizeName", "false"},
                           {"courier.proxies.calculator.queue.durable", "off"},
                           {"courier.proxies.calculator.channel.qos", "8"},
                           {"courier.proxies.calculator.channel.global", "true"},
                           {"courier.proxies.other.queue.name", "not-mine"}};
    auto endpoint = load_endpoint(properties, "calculator");
    CATCH_REQUIRE(endpoint.has_value());
    CATCH_REQUIRE(endpoint->exchange.name == "amq.direct");
    CATCH_REQUIRE(endpoint->exchange.type == "direct");
    CATCH_REQUIRE(endpoint->exchange.passive);
    CATCH_REQUIRE(endpoint->queue.name == "calc");
    CATCH_REQUIRE(!endpoint->queue.durable);
    CATCH_REQUIRE(endpoint->queue.autodelete);
    CATCH_REQUIRE(endpoint->channel.prefetch_count == 8);
    CATCH_REQUIRE(endpoint->channel.prefetch_is_global);
  }

  CATCH_SECTION("malformed values") {
    const auto invalid = make_error_code(ecode::invalid_data);
    for (const auto& [key, value] :
         std::vector<std::pair<std::string, std::string>>{
             {"courier.proxies.calc.exchange.durable", "maybe"},
             {"courier.proxies.calc.exchange.type", "round-robin"},
             {"courier.proxies.calc.channel.qos", "-1"},
             {"courier.proxies.calc.channel.qos", "70000"},
             {"courier.proxies.calc.channel.qos", "4x"}}) {
      PropertyMap properties{{key, value}};
      auto overrides = parse_endpoint_overrides(properties, "calc");
      CATCH_REQUIRE(!overrides.has_value());
      CATCH_REQUIRE(overrides.error() == invalid);
    }
  }

  CATCH_SECTION("client and server wiring") {
    const auto endpoint = resolve_endpoint("calculator");

    const auto client = make_client_config(endpoint);
    CATCH_REQUIRE(client.exchange == "calculator");
    CATCH_REQUIRE(client.routing_key == "calculator");
    CATCH_REQUIRE(client.mandatory);
    CATCH_REQUIRE(!client.immediate);
    CATCH_REQUIRE(!client.reply_queue.has_value());

    const auto server = make_server_config(endpoint);
    CATCH_REQUIRE(server.exchange.name == "calculator");
    CATCH_REQUIRE(server.queue.name == endpoint.queue.name);
    CATCH_REQUIRE(server.routing_key == "calculator");
    CATCH_REQUIRE(server.channel.prefetch_count == 1);
  }
}

CATCH_TEST_CASE("Properties", "[endpoint-config]") {
  PropertyMap properties;
  CATCH_REQUIRE(!parse_assignment(properties, "a.b=1"));
  CATCH_REQUIRE(!parse_assignment(properties, "a.c=x=y"));
  CATCH_REQUIRE(parse_assignment(properties, "no-equals") == make_error_code(ecode::argument_error));
  CATCH_REQUIRE(parse_assignment(properties, "=1") == make_error_code(ecode::argument_error));

  CATCH_REQUIRE(get_string(properties, "a.c") == std::optional<std::string>{"x=y"});
  CATCH_REQUIRE(get_bool(properties, "a.b").value() == std::optional<bool>{true});
  CATCH_REQUIRE(get_int(properties, "a.b", 0, 10).value() == std::optional<int64_t>{1});
  CATCH_REQUIRE(!get_int(properties, "a.c", 0, 10).has_value());
  CATCH_REQUIRE(!get_bool(properties, "missing").value().has_value());
}

} // namespace courier::mq::tests
