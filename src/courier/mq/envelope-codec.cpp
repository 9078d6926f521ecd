#include "envelope-codec.hpp"

#include <stdexcept>

namespace courier::mq {

static constexpr std::string_view k_legacy_swap_key = "courier.amqp.useLegacySerializerEncodingSwap";
static constexpr std::string_view k_namespace_mappings_prefix = "courier.amqp.namespaceMappings.";
static constexpr std::string_view k_default_serializer_key = "courier.amqp.defaultSerializer";

// -------------------------------------------------------------------------------------- CodecConfig

tl::expected<CodecConfig, std::error_code> parse_codec_config(const PropertyMap& properties) {
  CodecConfig config;

  auto swap = get_bool(properties, k_legacy_swap_key);
  if (!swap)
    return tl::make_unexpected(swap.error());
  config.legacy_encoding_swap = swap->value_or(false);

  for (auto ii = properties.lower_bound(k_namespace_mappings_prefix); ii != properties.end();
       ++ii) {
    const std::string_view key = ii->first;
    if (!key.starts_with(k_namespace_mappings_prefix))
      break;
    auto from = key.substr(k_namespace_mappings_prefix.size());
    if (from.empty())
      return tl::make_unexpected(make_error_code(ecode::invalid_data));
    config.namespace_mappings.insert_or_assign(std::string{from}, ii->second);
  }

  if (auto name = get_string(properties, k_default_serializer_key))
    config.default_serializer = std::move(*name);

  return config;
}

// ------------------------------------------------------------------------------------ EnvelopeCodec

EnvelopeCodec::EnvelopeCodec(std::shared_ptr<const SerializerRegistry> registry, CodecConfig config)
    : registry_{std::move(registry)}, config_{std::move(config)} {
  Expects(registry_ != nullptr);
  default_serializer_ = registry_->find(config_.default_serializer);
  if (default_serializer_ == nullptr) {
    WARN("default serializer '{}' is not registered, using '{}'", config_.default_serializer,
         registry_->default_name());
    default_serializer_ = registry_->default_serializer();
  }
  if (default_serializer_ == nullptr)
    throw std::invalid_argument{"EnvelopeCodec requires at least one registered serializer"};
}

std::shared_ptr<const Serializer> EnvelopeCodec::resolve(std::string_view name) const {
  auto serializer = registry_->find(name);
  if (serializer == nullptr) {
    TRACE("serializer '{}' is unknown, using default", name);
    return default_serializer_;
  }
  return serializer;
}

std::string_view EnvelopeCodec::serializer_name(const MessageProperties& properties) const {
  return config_.legacy_encoding_swap ? properties.content_type : properties.content_encoding;
}

std::string_view EnvelopeCodec::content_type(const MessageProperties& properties) const {
  return config_.legacy_encoding_swap ? properties.content_encoding : properties.content_type;
}

std::string EnvelopeCodec::map_type_name(std::string name) const {
  // Longest matching prefix wins
  const std::pair<const std::string, std::string>* best = nullptr;
  for (const auto& mapping : config_.namespace_mappings)
    if (std::string_view{name}.starts_with(mapping.first) &&
        (best == nullptr || mapping.first.size() > best->first.size()))
      best = &mapping;
  if (best != nullptr)
    name.replace(0, best->first.size(), best->second);
  return name;
}

void EnvelopeCodec::set_metadata_(MessageProperties& properties,
                                  const std::string& serializer_name,
                                  std::string content_type) const {
  if (config_.legacy_encoding_swap) {
    properties.content_encoding = std::move(content_type);
    properties.content_type = serializer_name;
  } else {
    properties.content_encoding = serializer_name;
    properties.content_type = std::move(content_type);
  }
}

} // namespace courier::mq
