#include "properties.hpp"

#include "courier/utils/base-include.hpp"

#include <cerrno>
#include <cstdlib>

namespace courier::mq {

std::optional<std::string> get_string(const PropertyMap& properties, std::string_view key) {
  auto ii = properties.find(key);
  if (ii == properties.end())
    return std::nullopt;
  return ii->second;
}

tl::expected<std::optional<bool>, std::error_code> get_bool(const PropertyMap& properties,
                                                            std::string_view key) {
  auto ii = properties.find(key);
  if (ii == properties.end())
    return std::optional<bool>{};

  const auto& value = ii->second;
  if (value == "true" || value == "yes" || value == "on" || value == "1")
    return std::optional<bool>{true};
  if (value == "false" || value == "no" || value == "off" || value == "0")
    return std::optional<bool>{false};

  WARN("expected boolean for '{}', but got '{}'", key, value);
  return tl::make_unexpected(make_error_code(ecode::invalid_data));
}

tl::expected<std::optional<int64_t>, std::error_code>
get_int(const PropertyMap& properties, std::string_view key, int64_t min_value, int64_t max_value) {
  auto ii = properties.find(key);
  if (ii == properties.end())
    return std::optional<int64_t>{};

  const auto& value = ii->second;
  char* end = nullptr;
  errno = 0;
  const auto parsed = std::strtoll(value.c_str(), &end, 10);
  if (value.empty() || *end != '\0' || errno == ERANGE || parsed < min_value ||
      parsed > max_value) {
    WARN("expected integer in [{}, {}] for '{}', but got '{}'", min_value, max_value, key, value);
    return tl::make_unexpected(make_error_code(ecode::invalid_data));
  }
  return std::optional<int64_t>{int64_t(parsed)};
}

std::error_code parse_assignment(PropertyMap& properties, std::string_view assignment) {
  const auto pos = assignment.find('=');
  if (pos == std::string_view::npos || pos == 0)
    return make_error_code(ecode::argument_error);
  properties.insert_or_assign(std::string{assignment.substr(0, pos)},
                              std::string{assignment.substr(pos + 1)});
  return {};
}

} // namespace courier::mq
