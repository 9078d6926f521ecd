#pragma once

#include "courier/utils/error-codes.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace courier::mq {

/**
 * @brief A local failure delivered through a Future: not connected, serialization,
 *        deserialization, or a transport error.
 */
class RpcError : public std::system_error {
public:
  explicit RpcError(std::error_code ec) : std::system_error{ec} {}
  RpcError(std::error_code ec, const std::string& what) : std::system_error{ec, what} {}
};

/**
 * @brief The server failed to process the request, and replied with a `ServerFailure`.
 */
class RemoteProcessingFailure : public std::runtime_error {
private:
  std::string details_{};

public:
  RemoteProcessingFailure(const std::string& message, std::string details)
      : std::runtime_error{message}, details_{std::move(details)} {}

  /** @brief The remote error message */
  std::string_view message() const noexcept { return what(); }

  /** @brief Context supplied by the server, typically the remote exception's description */
  std::string_view details() const noexcept { return details_; }
};

} // namespace courier::mq
