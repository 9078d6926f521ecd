#include "courier/async.hpp"

#include "stdinc.hpp"

#include <catch2/catch.hpp>

#include <boost/asio/io_context.hpp>

#include <memory>
#include <stdexcept>
#include <thread>

namespace courier::async
{
static void drain(boost::asio::io_context& io_context)
{
   io_context.restart();
   io_context.poll();
}

CATCH_TEST_CASE("ExtendedFutures", "[extended-futures]")
{
   boost::asio::io_context io_context;
   auto executor = make_execution_broker(io_context);

   CATCH_SECTION("set before get")
   {
      Promise<int> promise;
      auto future = promise.get_future();
      CATCH_REQUIRE(!future.is_ready());
      promise.set_value(42);
      CATCH_REQUIRE(future.is_ready());
      CATCH_REQUIRE(future.get() == 42);
      CATCH_REQUIRE(!future.valid());
   }

   CATCH_SECTION("the future can only be retrieved once")
   {
      Promise<int> promise;
      auto future = promise.get_future();
      CATCH_REQUIRE_THROWS_AS(promise.get_future(), std::future_error);
   }

   CATCH_SECTION("exceptions are rethrown by get")
   {
      auto future = make_exceptional_future<int>(std::make_exception_ptr(std::runtime_error{"x"}));
      CATCH_REQUIRE(future.has_exception());
      CATCH_REQUIRE_THROWS_AS(future.get(), std::runtime_error);
   }

   CATCH_SECTION("a dropped promise never resolves")
   {
      Future<int> future;
      {
         Promise<int> promise;
         future = promise.get_future();
      }
      CATCH_REQUIRE(future.wait_for(std::chrono::milliseconds{1}) == std::future_status::timeout);
   }

   CATCH_SECTION("then runs on the executor")
   {
      Promise<std::unique_ptr<int>> promise;
      auto f2 = promise.get_future().then(executor, [](std::unique_ptr<int> x) { return *x + 1; });
      promise.set_value(std::make_unique<int>(42));
      CATCH_REQUIRE(!f2.is_ready()); // posted, not run inline
      drain(io_context);
      CATCH_REQUIRE(f2.is_ready());
      CATCH_REQUIRE(f2.get() == 43);
   }

   CATCH_SECTION("then propagates exceptions")
   {
      auto f1 = make_ready_future(1);
      auto f2 = f1.then(executor, [](int) -> int { throw std::logic_error{"boom"}; });
      auto f3 = f2.then(executor, [](int x) { return x + 1; });
      drain(io_context);
      CATCH_REQUIRE(f3.is_ready());
      CATCH_REQUIRE_THROWS_AS(f3.get(), std::logic_error);
   }

   CATCH_SECTION("void continuations")
   {
      Promise<void> promise;
      bool ran = false;
      auto f2  = promise.get_future().then(executor, [&ran]() { ran = true; });
      promise.set_value();
      drain(io_context);
      CATCH_REQUIRE(ran);
      CATCH_REQUIRE(f2.is_ready());
   }

   CATCH_SECTION("on_ready hands over the ready future")
   {
      Promise<int> promise;
      int result = 0;
      promise.get_future().on_ready(executor, [&result](Future<int> ready) {
         result = ready.get();
      });
      promise.set_value(7);
      drain(io_context);
      CATCH_REQUIRE(result == 7);
   }

   CATCH_SECTION("wait across threads")
   {
      Promise<int> promise;
      auto future = promise.get_future();
      std::thread thread{[&promise]() { promise.set_value(3); }};
      future.wait();
      thread.join();
      CATCH_REQUIRE(future.get() == 3);
   }
}

} // namespace courier::async
