#pragma once

#include "message.hpp"

#include "courier/async/extended-futures.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace courier::mq {

/**
 * @brief A request that is waiting for `expected` replies.
 */
struct PendingRequest {
  std::string correlation_id{};
  async::Promise<RpcOutcome> destination{};
  uint32_t expected{1};
  std::vector<Delivery> deliveries{};
};

/**
 * @brief Pending requests by correlation id.
 *
 * Each pending request is resolved at most once: by its last expected delivery,
 * or by an undelivered notice, whichever comes first. Resolving removes the entry,
 * so anything that arrives later for the same id is unknown. Not thread safe; the
 * owning `RpcClient` only touches it on its strand.
 */
class CorrelationTable {
public:
  enum class MatchResult : int8_t {
    UNKNOWN,  //!< No pending request has that correlation id
    PENDING,  //!< Appended, more replies are expected
    COMPLETED //!< Appended, and the request was resolved
  };

private:
  std::unordered_map<std::string, PendingRequest> pending_{};

public:
  /**
   * @brief Add a pending request.
   * @return false (and drops `destination`) if `correlation_id` is already pending.
   */
  bool insert(std::string correlation_id, async::Promise<RpcOutcome> destination,
              uint32_t expected);

  /**
   * @brief Append `delivery` to the request named by its correlation id, resolving
   *        the request with a `Response` once all expected replies are in.
   */
  MatchResult append(Delivery delivery);

  /**
   * @brief Resolve the request named by the returned message's correlation id with
   *        `Undelivered`.
   * @return false if no such request is pending.
   */
  bool mark_undelivered(ReturnedMessage returned);

  /** @brief Remove a pending request without resolving it */
  std::optional<PendingRequest> take(std::string_view correlation_id);

  /**
   * @brief Remove every pending request without resolving it; their futures never become
   *        ready.
   * @return The number of requests removed.
   */
  std::size_t clear();

  std::size_t size() const noexcept { return pending_.size(); }
  bool empty() const noexcept { return pending_.empty(); }
  bool contains(std::string_view correlation_id) const;
};

const char* str(CorrelationTable::MatchResult result);

} // namespace courier::mq
