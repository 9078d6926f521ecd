#pragma once

#include "archive.hpp"
#include "message.hpp"
#include "properties.hpp"
#include "serializer.hpp"

#include "courier/utils/base-include.hpp"

#include <tl/expected.hpp>

#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace courier::mq {

// ------------------------------------------------------------------------------------- CodecConfig

struct CodecConfig {
  /**
   * Older peers put the serializer name in `content_type` and the type name in
   * `content_encoding`. Applies to both directions.
   */
  bool legacy_encoding_swap{false};

  /** Type-name prefix rewrites applied to `content_type`, e.g., "courier::" -> "acme::" */
  std::map<std::string, std::string> namespace_mappings{};

  /** Used when a body names no serializer, or one that is not registered */
  std::string default_serializer{SerializerRegistry::k_json};
};

/**
 * @brief Read `courier.amqp.useLegacySerializerEncodingSwap`,
 *        `courier.amqp.namespaceMappings.<from>` and `courier.amqp.defaultSerializer`.
 */
tl::expected<CodecConfig, std::error_code> parse_codec_config(const PropertyMap& properties);

// ----------------------------------------------------------------------------------------- Decoded

template <typename T> struct Decoded {
  T message{};
  std::shared_ptr<const Serializer> serializer{};
};

// ----------------------------------------------------------------------------------- EnvelopeCodec

/**
 * @brief Turns messages into envelopes (body + metadata) and back again.
 *
 * Immutable after construction, and so safe to share between clients, servers and
 * handler threads.
 */
class EnvelopeCodec {
private:
  std::shared_ptr<const SerializerRegistry> registry_;
  CodecConfig config_;
  std::shared_ptr<const Serializer> default_serializer_{};

  void set_metadata_(MessageProperties& properties, const std::string& serializer_name,
                     std::string content_type) const;

public:
  explicit EnvelopeCodec(std::shared_ptr<const SerializerRegistry> registry,
                         CodecConfig config = {});

  const CodecConfig& config() const noexcept { return config_; }
  const SerializerRegistry& registry() const noexcept { return *registry_; }

  /** @brief The configured default serializer */
  std::shared_ptr<const Serializer> default_serializer() const { return default_serializer_; }

  /** @brief The serializer named `name`, or else the default */
  std::shared_ptr<const Serializer> resolve(std::string_view name) const;

  /** @brief The serializer name carried by `properties` (honours the legacy swap) */
  std::string_view serializer_name(const MessageProperties& properties) const;

  /** @brief The type name carried by `properties` (honours the legacy swap) */
  std::string_view content_type(const MessageProperties& properties) const;

  /** @brief The type name that `serialize` records for `T`, after namespace mapping */
  std::string map_type_name(std::string name) const;
  template <typename T> std::string content_type_of() const { return map_type_name(type_name<T>()); }

  // --------------------------------------------------------------------------------------- encode

  /**
   * @brief Encode `message` with `serializer`, which must be registered.
   * @return `ecode::serialization_error` if encoding fails for any reason.
   */
  template <Message T>
  tl::expected<Envelope, std::error_code> serialize(const T& message,
                                                    const Serializer& serializer) const {
    const auto name = registry_->name_of(serializer);
    if (!name) {
      WARN("cannot serialize {}: serializer is not registered", type_name<T>());
      return tl::make_unexpected(make_error_code(ecode::serialization_error));
    }

    try {
      auto archive = serializer.make_output_archive();
      FieldWriter writer{*archive};
      T::fields(writer, message);
      auto body = archive->finish();
      if (!body) {
        WARN("failed to serialize {} with '{}': {}", type_name<T>(), *name, body.error().message());
        return tl::make_unexpected(make_error_code(ecode::serialization_error));
      }

      Envelope envelope;
      envelope.body = std::move(*body);
      set_metadata_(envelope.properties, *name, content_type_of<T>());
      return envelope;
    } catch (const std::exception& e) {
      WARN("exception serializing {} with '{}': {}", type_name<T>(), *name, e.what());
    }
    return tl::make_unexpected(make_error_code(ecode::serialization_error));
  }

  /**
   * @brief Encode `message` with the default serializer.
   */
  template <Message T> tl::expected<Envelope, std::error_code> serialize(const T& message) const {
    return serialize(message, *default_serializer_);
  }

  // --------------------------------------------------------------------------------------- decode

  /**
   * @brief Decode `body` as a `T`, with the serializer named in `properties`.
   *
   * An absent or unknown serializer name is not an error: the default serializer is used.
   *
   * @return `ecode::deserialization_error` if `body` does not decode as a `T`.
   */
  template <Message T>
  tl::expected<Decoded<T>, std::error_code>
  deserialize(std::span<const std::byte> body, const MessageProperties& properties) const {
    auto serializer = resolve(serializer_name(properties));
    try {
      auto archive = serializer->make_input_archive(body);
      if (!archive) {
        LOG_DEBUG("failed to deserialize {}: {}", type_name<T>(), archive.error().message());
        return tl::make_unexpected(make_error_code(ecode::deserialization_error));
      }

      Decoded<T> decoded{T{}, std::move(serializer)};
      FieldReader reader{**archive};
      T::fields(reader, decoded.message);
      auto ec = reader.error();
      if (!ec)
        ec = (*archive)->finish();
      if (ec) {
        LOG_DEBUG("failed to deserialize {}: {}", type_name<T>(), ec.message());
        return tl::make_unexpected(make_error_code(ecode::deserialization_error));
      }
      return decoded;
    } catch (const std::exception& e) {
      WARN("exception deserializing {}: {}", type_name<T>(), e.what());
    }
    return tl::make_unexpected(make_error_code(ecode::deserialization_error));
  }
};

} // namespace courier::mq
