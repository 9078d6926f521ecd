#include "correlation-table.hpp"

#include "courier/utils/base-include.hpp"

namespace courier::mq {

const char* str(CorrelationTable::MatchResult result) {
  switch (result) {
  case CorrelationTable::MatchResult::UNKNOWN: return "UNKNOWN";
  case CorrelationTable::MatchResult::PENDING: return "PENDING";
  case CorrelationTable::MatchResult::COMPLETED: return "COMPLETED";
  }
  return "<unknown>";
}

bool CorrelationTable::insert(std::string correlation_id, async::Promise<RpcOutcome> destination,
                              uint32_t expected) {
  Expects(expected > 0);
  if (pending_.contains(correlation_id))
    return false;
  PendingRequest request;
  request.correlation_id = correlation_id;
  request.destination = std::move(destination);
  request.expected = expected;
  request.deliveries.reserve(expected);
  pending_.emplace(std::move(correlation_id), std::move(request));
  return true;
}

CorrelationTable::MatchResult CorrelationTable::append(Delivery delivery) {
  auto ii = pending_.find(delivery.properties.correlation_id);
  if (ii == pending_.end())
    return MatchResult::UNKNOWN;

  auto& request = ii->second;
  request.deliveries.push_back(std::move(delivery));
  if (request.deliveries.size() < request.expected)
    return MatchResult::PENDING;

  // Erase first: setting the value may run continuations
  auto completed = std::move(request);
  pending_.erase(ii);
  completed.destination.set_value(RpcOutcome{Response{std::move(completed.deliveries)}});
  return MatchResult::COMPLETED;
}

bool CorrelationTable::mark_undelivered(ReturnedMessage returned) {
  auto ii = pending_.find(returned.properties.correlation_id);
  if (ii == pending_.end())
    return false;

  auto request = std::move(ii->second);
  pending_.erase(ii);
  request.destination.set_value(RpcOutcome{Undelivered{std::move(returned)}});
  return true;
}

std::optional<PendingRequest> CorrelationTable::take(std::string_view correlation_id) {
  auto ii = pending_.find(std::string{correlation_id});
  if (ii == pending_.end())
    return std::nullopt;
  auto request = std::move(ii->second);
  pending_.erase(ii);
  return request;
}

std::size_t CorrelationTable::clear() {
  const auto count = pending_.size();
  pending_.clear();
  return count;
}

bool CorrelationTable::contains(std::string_view correlation_id) const {
  return pending_.contains(std::string{correlation_id});
}

} // namespace courier::mq
