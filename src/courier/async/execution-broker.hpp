#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <utility>

namespace courier::async
{

/**
 * @ingroup async
 * @brief An adaptor for executing on an asio executor (an io_context, or a strand of
 *        one), so that it can run Future continuations.
 *
 * Work is always posted, never run inline, so a continuation never re-enters the
 * code that set the Promise.
 */
template<typename Executor> class ExecutionBroker
{
 private:
   Executor executor_;

 public:
   explicit ExecutionBroker(Executor executor)
       : executor_{std::move(executor)}
   {}

   /**
    * @brief So that an ExecutionBroker can also be an Executor
    */
   template<typename F> void execute(F&& work) const
   {
      boost::asio::post(executor_, std::forward<F>(work));
   }

   /**
    * @brief Post the work to the underlying executor
    */
   template<typename F> void post(F&& work) const
   {
      boost::asio::post(executor_, std::forward<F>(work));
   }

   const Executor& get_executor() const noexcept { return executor_; }
};

using IoContextBroker = ExecutionBroker<boost::asio::io_context::executor_type>;
using StrandBroker
    = ExecutionBroker<boost::asio::strand<boost::asio::io_context::executor_type>>;

inline IoContextBroker make_execution_broker(boost::asio::io_context& io_context)
{
   return IoContextBroker{io_context.get_executor()};
}

} // namespace courier::async
