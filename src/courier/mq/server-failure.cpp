#include "server-failure.hpp"

#include "courier/utils/base-include.hpp"

#include <boost/core/demangle.hpp>

#include <typeinfo>

namespace courier::mq {

ServerFailure describe_failure(std::exception_ptr error) {
  if (error == nullptr)
    return ServerFailure{"unknown failure", "no exception"};
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return ServerFailure{e.what(), format("{}: {}", boost::core::demangle(typeid(e).name()), e.what())};
  } catch (...) {
    return ServerFailure{"unknown exception", "exception not derived from std::exception"};
  }
}

} // namespace courier::mq
