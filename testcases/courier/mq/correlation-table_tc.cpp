#include "courier/mq/correlation-table.hpp"

#include "test-support.hpp"

#include "stdinc.hpp"

#include <catch2/catch.hpp>

namespace courier::mq::tests {

using testing::make_reply;
using MatchResult = CorrelationTable::MatchResult;

CATCH_TEST_CASE("CorrelationTable", "[correlation-table]") {
  CorrelationTable table;

  CATCH_SECTION("resolves once all expected replies arrive, in arrival order") {
    async::Promise<RpcOutcome> promise;
    auto future = promise.get_future();
    CATCH_REQUIRE(table.insert("1", std::move(promise), 3));
    CATCH_REQUIRE(table.contains("1"));

    CATCH_REQUIRE(table.append(make_reply(10, "1")) == MatchResult::PENDING);
    CATCH_REQUIRE(table.append(make_reply(12, "1")) == MatchResult::PENDING);
    CATCH_REQUIRE(!future.is_ready());
    CATCH_REQUIRE(table.append(make_reply(11, "1")) == MatchResult::COMPLETED);
    CATCH_REQUIRE(table.empty());

    auto outcome = future.get();
    const auto& response = std::get<Response>(outcome);
    CATCH_REQUIRE(response.deliveries.size() == 3);
    CATCH_REQUIRE(response.deliveries[0].delivery_tag == 10);
    CATCH_REQUIRE(response.deliveries[1].delivery_tag == 12);
    CATCH_REQUIRE(response.deliveries[2].delivery_tag == 11);
  }

  CATCH_SECTION("unknown and late replies do not disturb other requests") {
    async::Promise<RpcOutcome> p1;
    async::Promise<RpcOutcome> p2;
    auto f1 = p1.get_future();
    auto f2 = p2.get_future();
    CATCH_REQUIRE(table.insert("1", std::move(p1), 1));
    CATCH_REQUIRE(table.insert("2", std::move(p2), 2));

    CATCH_REQUIRE(table.append(make_reply(1, "1")) == MatchResult::COMPLETED);
    CATCH_REQUIRE(table.append(make_reply(2, "1")) == MatchResult::UNKNOWN);
    CATCH_REQUIRE(table.append(make_reply(3, "99")) == MatchResult::UNKNOWN);
    CATCH_REQUIRE(table.append(make_reply(4, "")) == MatchResult::UNKNOWN);

    CATCH_REQUIRE(f1.is_ready());
    CATCH_REQUIRE(!f2.is_ready());
    CATCH_REQUIRE(table.size() == 1);
    CATCH_REQUIRE(table.append(make_reply(5, "2")) == MatchResult::PENDING);
  }

  CATCH_SECTION("an undelivered notice wins over later replies") {
    async::Promise<RpcOutcome> promise;
    auto future = promise.get_future();
    CATCH_REQUIRE(table.insert("7", std::move(promise), 2));
    CATCH_REQUIRE(table.append(make_reply(1, "7")) == MatchResult::PENDING);

    ReturnedMessage returned;
    returned.reply_code = 312;
    returned.properties.correlation_id = "7";
    CATCH_REQUIRE(table.mark_undelivered(returned));
    CATCH_REQUIRE(!table.mark_undelivered(returned));
    CATCH_REQUIRE(table.append(make_reply(2, "7")) == MatchResult::UNKNOWN);

    auto outcome = future.get();
    CATCH_REQUIRE(std::get<Undelivered>(outcome).message.reply_code == 312);
  }

  CATCH_SECTION("duplicate ids are refused") {
    CATCH_REQUIRE(table.insert("1", async::Promise<RpcOutcome>{}, 1));
    CATCH_REQUIRE(!table.insert("1", async::Promise<RpcOutcome>{}, 1));
    CATCH_REQUIRE(table.size() == 1);
  }

  CATCH_SECTION("clear drops everything without resolving") {
    async::Promise<RpcOutcome> promise;
    auto future = promise.get_future();
    CATCH_REQUIRE(table.insert("1", std::move(promise), 1));
    CATCH_REQUIRE(table.insert("2", async::Promise<RpcOutcome>{}, 1));
    CATCH_REQUIRE(table.clear() == 2);
    CATCH_REQUIRE(table.empty());
    CATCH_REQUIRE(future.wait_for(std::chrono::milliseconds{1}) == std::future_status::timeout);
    CATCH_REQUIRE(table.append(make_reply(1, "1")) == MatchResult::UNKNOWN);
  }

  CATCH_SECTION("take removes without resolving") {
    async::Promise<RpcOutcome> promise;
    auto future = promise.get_future();
    CATCH_REQUIRE(table.insert("1", std::move(promise), 1));
    auto request = table.take("1");
    CATCH_REQUIRE(request.has_value());
    CATCH_REQUIRE(request->expected == 1);
    CATCH_REQUIRE(!table.take("1").has_value());
    CATCH_REQUIRE(!future.is_ready());
  }
}

} // namespace courier::mq::tests
