#include "endpoint-config.hpp"

#include "courier/utils/base-include.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace courier::mq {

static std::string random_suffix() {
  thread_local boost::uuids::random_generator generator;
  return "-" + boost::uuids::to_string(generator());
}

// ------------------------------------------------------------------------------- resolve-endpoint

EndpointConfig resolve_endpoint(std::string_view name, const EndpointOverrides& overrides) {
  EndpointConfig config;
  config.name = std::string{name};

  auto& exchange = config.exchange;
  exchange.name = overrides.exchange_name.value_or(config.name);
  exchange.type = overrides.exchange_type.value_or("fanout");
  exchange.passive = overrides.exchange_passive.value_or(false);
  exchange.durable = overrides.exchange_durable.value_or(true);
  exchange.autodelete = overrides.exchange_autodelete.value_or(false);

  auto& queue = config.queue;
  queue.name = overrides.queue_name.value_or(config.name);
  if (overrides.queue_randomize.value_or(true))
    queue.name += random_suffix();
  queue.passive = overrides.queue_passive.value_or(false);
  queue.durable = overrides.queue_durable.value_or(true);
  queue.autodelete = overrides.queue_autodelete.value_or(true);

  config.channel.prefetch_count = overrides.prefetch_count.value_or(1);
  config.channel.prefetch_is_global = overrides.prefetch_is_global.value_or(false);

  return config;
}

// ----------------------------------------------------------------------- parse-endpoint-overrides

tl::expected<EndpointOverrides, std::error_code>
parse_endpoint_overrides(const PropertyMap& properties, std::string_view name) {
  const auto prefix = format("courier.proxies.{}.", name);
  const auto key = [&prefix](std::string_view suffix) { return prefix + std::string{suffix}; };

  EndpointOverrides overrides;
  std::error_code ec;

  auto read_bool = [&](std::string_view suffix, std::optional<bool>& value) {
    if (ec)
      return;
    auto parsed = get_bool(properties, key(suffix));
    if (parsed)
      value = *parsed;
    else
      ec = parsed.error();
  };

  overrides.exchange_name = get_string(properties, key("exchange.name"));
  overrides.exchange_type = get_string(properties, key("exchange.type"));
  read_bool("exchange.passive", overrides.exchange_passive);
  read_bool("exchange.durable", overrides.exchange_durable);
  read_bool("exchange.autodelete", overrides.exchange_autodelete);

  overrides.queue_name = get_string(properties, key("queue.name"));
  read_bool("queue.randomizeName", overrides.queue_randomize);
  read_bool("queue.passive", overrides.queue_passive);
  read_bool("queue.durable", overrides.queue_durable);
  read_bool("queue.autodelete", overrides.queue_autodelete);

  read_bool("channel.global", overrides.prefetch_is_global);
  if (ec)
    return tl::make_unexpected(ec);

  auto qos = get_int(properties, key("channel.qos"), 0, std::numeric_limits<uint16_t>::max());
  if (!qos)
    return tl::make_unexpected(qos.error());
  if (qos->has_value())
    overrides.prefetch_count = uint16_t(**qos);

  if (overrides.exchange_type) {
    const auto& type = *overrides.exchange_type;
    if (type != "direct" && type != "fanout" && type != "topic" && type != "headers") {
      WARN("unknown exchange type '{}' for endpoint '{}'", type, name);
      return tl::make_unexpected(make_error_code(ecode::invalid_data));
    }
  }

  return overrides;
}

tl::expected<EndpointConfig, std::error_code> load_endpoint(const PropertyMap& properties,
                                                            std::string_view name) {
  return parse_endpoint_overrides(properties, name).map([name](const EndpointOverrides& overrides) {
    return resolve_endpoint(name, overrides);
  });
}

} // namespace courier::mq
