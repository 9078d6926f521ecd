#pragma once

#include <exception>
#include <string>

namespace courier::mq {

/**
 * @brief The reply a server sends when processing a request fails.
 *
 * Clients recognise it by its type name, and raise it as a `RemoteProcessingFailure`.
 */
struct ServerFailure {
  std::string message{};
  std::string details{};

  template <typename Archive, typename Self> static void fields(Archive& ar, Self& self) {
    ar("message", self.message)("details", self.details);
  }
};

/**
 * @brief Describe the exception in `error`: its message, and "<exception type>: <message>"
 *        as details.
 */
ServerFailure describe_failure(std::exception_ptr error);

} // namespace courier::mq
