#include "courier/mq/envelope-codec.hpp"
#include "courier/mq/server-failure.hpp"

#include "test-support.hpp"

#include "stdinc.hpp"

#include <catch2/catch.hpp>

#include <cmath>
#include <limits>

namespace courier::mq::tests {

using testing::DoubleRequest;
using testing::Everything;

namespace {
  class ThrowingSerializer final : public Serializer {
  public:
    std::unique_ptr<OutputArchive> make_output_archive() const override {
      throw std::runtime_error{"no archive"};
    }
    tl::expected<std::unique_ptr<InputArchive>, std::error_code>
    make_input_archive(std::span<const std::byte>) const override {
      throw std::runtime_error{"no archive"};
    }
  };
} // namespace

CATCH_TEST_CASE("EnvelopeCodec", "[envelope-codec]") {
  auto registry = SerializerRegistry::make_default();
  const EnvelopeCodec codec{registry};
  const Everything message{true, -7, 1ull << 40, 0.5, "héllo \"world\""};

  CATCH_SECTION("every registered serializer round trips") {
    for (auto name : {SerializerRegistry::k_json, SerializerRegistry::k_binary}) {
      auto serializer = registry->find(name);
      CATCH_REQUIRE(serializer != nullptr);

      auto envelope = codec.serialize(message, *serializer);
      CATCH_REQUIRE(envelope.has_value());
      CATCH_REQUIRE(envelope->properties.content_encoding == name);
      CATCH_REQUIRE(envelope->properties.content_type == type_name<Everything>());

      auto decoded = codec.deserialize<Everything>(envelope->body, envelope->properties);
      CATCH_REQUIRE(decoded.has_value());
      CATCH_REQUIRE(decoded->message == message);
      CATCH_REQUIRE(decoded->serializer == serializer);
    }
  }

  CATCH_SECTION("non-finite doubles fail to encode as json, and round trip as binary") {
    const auto binary = registry->find(SerializerRegistry::k_binary);
    for (auto ratio : {std::numeric_limits<double>::quiet_NaN(),
                       std::numeric_limits<double>::infinity(),
                       -std::numeric_limits<double>::infinity()}) {
      Everything odd = message;
      odd.ratio = ratio;

      auto json = codec.serialize(odd, *registry->find(SerializerRegistry::k_json));
      CATCH_REQUIRE(!json.has_value());
      CATCH_REQUIRE(json.error() == make_error_code(ecode::serialization_error));

      auto envelope = codec.serialize(odd, *binary);
      CATCH_REQUIRE(envelope.has_value());
      auto decoded = codec.deserialize<Everything>(envelope->body, envelope->properties);
      CATCH_REQUIRE(decoded.has_value());
      if (std::isnan(ratio)) {
        CATCH_REQUIRE(std::isnan(decoded->message.ratio));
      } else {
        CATCH_REQUIRE(decoded->message.ratio == ratio);
      }
      CATCH_REQUIRE(decoded->message.text == odd.text);
    }
  }

  CATCH_SECTION("json bodies are objects keyed by field name") {
    auto envelope = codec.serialize(DoubleRequest{21});
    CATCH_REQUIRE(envelope.has_value());
    CATCH_REQUIRE(str(envelope->body) == R"({"value":21})");
  }

  CATCH_SECTION("an unknown serializer name falls back to the default") {
    auto envelope = codec.serialize(DoubleRequest{21});
    CATCH_REQUIRE(envelope.has_value());
    envelope->properties.content_encoding = "no-such-serializer";
    auto decoded = codec.deserialize<DoubleRequest>(envelope->body, envelope->properties);
    CATCH_REQUIRE(decoded.has_value());
    CATCH_REQUIRE(decoded->message.value == 21);
    CATCH_REQUIRE(decoded->serializer == registry->find("json"));

    envelope->properties.content_encoding.clear();
    CATCH_REQUIRE(codec.deserialize<DoubleRequest>(envelope->body, envelope->properties));
  }

  CATCH_SECTION("the configured default serializer is used") {
    CodecConfig config;
    config.default_serializer = "binary";
    const EnvelopeCodec binary_codec{registry, config};
    auto envelope = binary_codec.serialize(DoubleRequest{3});
    CATCH_REQUIRE(envelope.has_value());
    CATCH_REQUIRE(envelope->properties.content_encoding == "binary");
    CATCH_REQUIRE(envelope->body.size() == 8);
  }

  CATCH_SECTION("bodies that do not decode are deserialization errors") {
    MessageProperties properties;
    properties.content_encoding = "json";
    const auto expected_error = make_error_code(ecode::deserialization_error);

    auto not_json = make_send_buffer("{value");
    CATCH_REQUIRE(codec.deserialize<DoubleRequest>(not_json, properties).error() == expected_error);

    auto wrong_type = make_send_buffer(R"({"value":"twenty"})");
    CATCH_REQUIRE(codec.deserialize<DoubleRequest>(wrong_type, properties).error() ==
                  expected_error);

    auto missing_field = make_send_buffer(R"({"other":1})");
    CATCH_REQUIRE(codec.deserialize<DoubleRequest>(missing_field, properties).error() ==
                  expected_error);

    properties.content_encoding = "binary";
    auto trailing = make_send_buffer("0123456789");
    CATCH_REQUIRE(codec.deserialize<DoubleRequest>(trailing, properties).error() ==
                  expected_error);
  }

  CATCH_SECTION("narrowing out of range is a deserialization error") {
    MessageProperties properties;
    properties.content_encoding = "json";
    auto body = make_send_buffer(
        R"({"flag":true,"small":3000000000,"big":1,"ratio":1.0,"text":""})");
    CATCH_REQUIRE(!codec.deserialize<Everything>(body, properties));

    body = make_send_buffer(R"({"flag":true,"small":1,"big":-1,"ratio":1.0,"text":""})");
    CATCH_REQUIRE(!codec.deserialize<Everything>(body, properties));
  }

  CATCH_SECTION("serializer exceptions are reported, not thrown") {
    auto throwing = std::make_shared<ThrowingSerializer>();
    registry->register_serializer("throwing", throwing);
    const EnvelopeCodec throwing_codec{registry};

    auto envelope = throwing_codec.serialize(DoubleRequest{1}, *throwing);
    CATCH_REQUIRE(envelope.error() == make_error_code(ecode::serialization_error));

    MessageProperties properties;
    properties.content_encoding = "throwing";
    auto body = make_send_buffer("{}");
    CATCH_REQUIRE(throwing_codec.deserialize<DoubleRequest>(body, properties).error() ==
                  make_error_code(ecode::deserialization_error));
  }

  CATCH_SECTION("unregistered serializers cannot encode") {
    JsonSerializer unregistered;
    auto envelope = codec.serialize(DoubleRequest{1}, unregistered);
    CATCH_REQUIRE(envelope.error() == make_error_code(ecode::serialization_error));
  }

  CATCH_SECTION("legacy swap exchanges the metadata fields") {
    CodecConfig config;
    config.legacy_encoding_swap = true;
    const EnvelopeCodec legacy{registry, config};

    auto envelope = legacy.serialize(DoubleRequest{5}, *registry->find("binary"));
    CATCH_REQUIRE(envelope.has_value());
    CATCH_REQUIRE(envelope->properties.content_type == "binary");
    CATCH_REQUIRE(envelope->properties.content_encoding == type_name<DoubleRequest>());
    CATCH_REQUIRE(legacy.content_type(envelope->properties) == type_name<DoubleRequest>());

    auto decoded = legacy.deserialize<DoubleRequest>(envelope->body, envelope->properties);
    CATCH_REQUIRE(decoded.has_value());
    CATCH_REQUIRE(decoded->message.value == 5);
  }

  CATCH_SECTION("namespace mappings rewrite the longest matching prefix") {
    CodecConfig config;
    config.namespace_mappings["courier::"] = "acme::";
    config.namespace_mappings["courier::mq::"] = "acme.mq.";
    const EnvelopeCodec mapped{registry, config};

    CATCH_REQUIRE(mapped.map_type_name("courier::mq::ServerFailure") == "acme.mq.ServerFailure");
    CATCH_REQUIRE(mapped.map_type_name("courier::Other") == "acme::Other");
    CATCH_REQUIRE(mapped.map_type_name("std::string") == "std::string");

    auto envelope = mapped.serialize(ServerFailure{"a", "b"});
    CATCH_REQUIRE(envelope.has_value());
    CATCH_REQUIRE(envelope->properties.content_type == mapped.content_type_of<ServerFailure>());
  }
}

CATCH_TEST_CASE("ParseCodecConfig", "[envelope-codec]") {
  CATCH_SECTION("defaults") {
    auto config = parse_codec_config({});
    CATCH_REQUIRE(config.has_value());
    CATCH_REQUIRE(!config->legacy_encoding_swap);
    CATCH_REQUIRE(config->namespace_mappings.empty());
    CATCH_REQUIRE(config->default_serializer == "json");
  }

  CATCH_SECTION("all keys") {
    PropertyMap properties{{"courier.amqp.useLegacySerializerEncodingSwap", "true"},
                           {"courier.amqp.namespaceMappings.space.spacelift", "courier"},
                           {"courier.amqp.namespaceMappings.org.example", "acme"},
                           {"courier.amqp.defaultSerializer", "binary"},
                           {"courier.amqp.other", "ignored"}};
    auto config = parse_codec_config(properties);
    CATCH_REQUIRE(config.has_value());
    CATCH_REQUIRE(config->legacy_encoding_swap);
    CATCH_REQUIRE(config->namespace_mappings.size() == 2);
    CATCH_REQUIRE(config->namespace_mappings.at("space.spacelift") == "courier");
    CATCH_REQUIRE(config->namespace_mappings.at("org.example") == "acme");
    CATCH_REQUIRE(config->default_serializer == "binary");
  }

  CATCH_SECTION("malformed boolean") {
    PropertyMap properties{{"courier.amqp.useLegacySerializerEncodingSwap", "sometimes"}};
    auto config = parse_codec_config(properties);
    CATCH_REQUIRE(!config.has_value());
    CATCH_REQUIRE(config.error() == make_error_code(ecode::invalid_data));
  }
}

} // namespace courier::mq::tests
