#pragma once

#include "properties.hpp"
#include "transport.hpp"

#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace courier::mq {

/**
 * @brief Per-endpoint settings that replace the defaults of `resolve_endpoint`.
 */
struct EndpointOverrides {
  std::optional<std::string> exchange_name{};
  std::optional<std::string> exchange_type{};
  std::optional<bool> exchange_passive{};
  std::optional<bool> exchange_durable{};
  std::optional<bool> exchange_autodelete{};

  std::optional<std::string> queue_name{};
  std::optional<bool> queue_randomize{};
  std::optional<bool> queue_passive{};
  std::optional<bool> queue_durable{};
  std::optional<bool> queue_autodelete{};

  std::optional<uint16_t> prefetch_count{};
  std::optional<bool> prefetch_is_global{};
};

/**
 * @brief The topology of a logical endpoint, e.g., "calculator".
 */
struct EndpointConfig {
  std::string name{};
  ExchangeParameters exchange{};
  QueueParameters queue{};
  ChannelParameters channel{};
};

/**
 * @brief Topology for endpoint `name`.
 *
 * Defaults: a durable `fanout` exchange called `name`; a durable, autodelete queue
 * called `name` with a random `-<uuid>` suffix; a prefetch of 1 per consumer.
 * The suffix is fresh on every call.
 */
EndpointConfig resolve_endpoint(std::string_view name, const EndpointOverrides& overrides = {});

/**
 * @brief Read the `courier.proxies.<name>.{exchange,queue,channel}.*` keys.
 * @return `ecode::invalid_data` if a value is malformed.
 */
tl::expected<EndpointOverrides, std::error_code>
parse_endpoint_overrides(const PropertyMap& properties, std::string_view name);

/**
 * @brief `resolve_endpoint(name, parse_endpoint_overrides(properties, name))`
 */
tl::expected<EndpointConfig, std::error_code> load_endpoint(const PropertyMap& properties,
                                                            std::string_view name);

} // namespace courier::mq
