#pragma once

#include <tl/expected.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace courier::mq {

/**
 * @brief Flat configuration: dotted keys to string values, e.g.,
 *        `courier.proxies.calculator.channel.qos = 4`
 */
using PropertyMap = std::map<std::string, std::string, std::less<>>;

/**
 * @brief The value at `key`, if present.
 */
std::optional<std::string> get_string(const PropertyMap& properties, std::string_view key);

/**
 * @brief The boolean at `key`, if present. Accepts true/false, yes/no, on/off and 1/0.
 * @return `ecode::invalid_data` if the value is not a boolean.
 */
tl::expected<std::optional<bool>, std::error_code> get_bool(const PropertyMap& properties,
                                                            std::string_view key);

/**
 * @brief The integer at `key`, if present.
 * @return `ecode::invalid_data` if the value is not an integer in `[min_value, max_value]`.
 */
tl::expected<std::optional<int64_t>, std::error_code>
get_int(const PropertyMap& properties, std::string_view key, int64_t min_value, int64_t max_value);

/**
 * @brief Parse `key=value` into `properties`.
 * @return `ecode::argument_error` if `assignment` has no `=`, or an empty key.
 */
std::error_code parse_assignment(PropertyMap& properties, std::string_view assignment);

} // namespace courier::mq
