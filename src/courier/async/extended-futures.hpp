
#pragma once

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

namespace courier::async
{
template<typename R> class Promise;
template<typename R> class Future;

template<typename R> Future<R> make_ready_future(R value);
template<typename R> Future<R> make_exceptional_future(std::exception_ptr ex_ptr);

namespace detail
{

   template<typename R>
   class PromiseFutureSharedState : public std::enable_shared_from_this<PromiseFutureSharedState<R>>
   {
    public:
      static constexpr bool is_void_result = std::is_same_v<R, void>;

    private:
      using ResultType = std::conditional_t<is_void_result, int8_t, R>;

      mutable std::mutex padlock_         = {};
      mutable std::condition_variable cv_ = {};
      std::exception_ptr exception_ptr_   = {};
      std::optional<ResultType> value_    = {};
      bool is_set_                        = false;
      bool future_is_retreived_         = false;
      std::function<void()> then_       = {};

      void notify_locked_(std::unique_lock<std::mutex>& lock)
      {
         is_set_   = true;
         auto then = std::move(then_);
         then_     = nullptr;
         cv_.notify_all();
         lock.unlock();
         if(then) then(); // execute the continuation outside the lock
      }

    public:
      ///@{ getters
      bool is_ready() const
      {
         std::lock_guard lock{padlock_};
         return is_set_;
      }

      bool has_exception_ptr() const
      {
         std::lock_guard lock{padlock_};
         return exception_ptr_ != nullptr;
      }
      ///@}

      void flag_future_has_been_retreived()
      {
         std::lock_guard lock{padlock_};
         if(future_is_retreived_)
            throw std::future_error{std::future_errc::future_already_retrieved};
         future_is_retreived_ = true;
      }

      void set_exception_ptr(std::exception_ptr ex_ptr)
      {
         std::unique_lock lock{padlock_};
         if(is_set_) throw std::future_error{std::future_errc::promise_already_satisfied};
         exception_ptr_ = ex_ptr;
         notify_locked_(lock);
      }

      template<typename T = R>
      std::enable_if_t<!std::is_same_v<T, void>, void> set_value(T&& new_value)
      {
         std::unique_lock lock{padlock_};
         if(is_set_) throw std::future_error{std::future_errc::promise_already_satisfied};
         value_ = std::forward<T>(new_value);
         notify_locked_(lock);
      }

      template<typename T = R> std::enable_if_t<std::is_same_v<T, void>, void> set_value()
      {
         std::unique_lock lock{padlock_};
         if(is_set_) throw std::future_error{std::future_errc::promise_already_satisfied};
         value_ = int8_t{0};
         notify_locked_(lock);
      }

      ///@{ wait
      void wait() const
      {
         std::unique_lock lock{padlock_};
         cv_.wait(lock, [this]() { return is_set_; });
      }

      template<typename Rep, typename Period>
      std::future_status wait_for(const std::chrono::duration<Rep, Period>& duration) const
      {
         std::unique_lock lock{padlock_};
         return cv_.wait_for(lock, duration, [this]() { return is_set_; })
                    ? std::future_status::ready
                    : std::future_status::timeout;
      }
      ///@}

      R get()
      {
         wait(); // noop if `is_set_`
         if(exception_ptr_ != nullptr) std::rethrow_exception(exception_ptr_);
         if constexpr(!is_void_result) {
            assert(value_.has_value());
            return std::move(*value_);
         }
      }

      /**
       * @brief Sets `thunk` to run once the shared state is set. If already set, then
       * `thunk` is run immediately in the calling thread.
       */
      void on_ready(std::function<void()> thunk)
      {
         std::unique_lock lock{padlock_};
         if(!is_set_) {
            assert(!then_);
            then_ = std::move(thunk);
            return;
         }
         lock.unlock();
         thunk();
      }
   };

   template<typename F, typename R> struct continuation_result
   {
      using type = std::invoke_result_t<F, R>;
   };

   template<typename F> struct continuation_result<F, void>
   {
      using type = std::invoke_result_t<F>;
   };

} // namespace detail

// ------------------------------------------------------------------------------------------ Future

/**
 * @ingroup async
 * @brief Provides a way to access the result of an asynchronous operation.
 *
 * Every outcome of a broker request (responses, undelivered notices, and typed
 * failures) reaches the caller through a Future. It is possible to _blocking wait_
 * on the result, or alternatively set a `then` function which will execute on an
 * executor when the value of the Future is set.
 *
 * A Future whose Promise is destroyed without being set never becomes ready. There
 * is no `broken_promise`: callers bound their wait with `wait_for`.
 */
template<typename R> class Future final
{
 private:
   using shared_state_type = detail::PromiseFutureSharedState<R>;
   std::shared_ptr<shared_state_type> shared_state_{};

   friend class Promise<R>;

   // throws std::future_error future_already_retrieved
   explicit Future(std::shared_ptr<shared_state_type> shared_state)
       : shared_state_{std::move(shared_state)}
   {
      shared_state_->flag_future_has_been_retreived();
   }

   void check_state_() const
   {
      if(!valid()) throw std::future_error{std::future_errc::no_state};
   }

 public:
   ///@{ @name construction/assignment/swap
   Future() noexcept                      = default;
   Future(const Future& o)                = delete;
   Future(Future&& o) noexcept            = default;
   ~Future()                              = default;
   Future& operator=(const Future& o)     = delete;
   Future& operator=(Future&& o) noexcept = default;

   void swap(Future& o) noexcept
   {
      using std::swap;
      swap(shared_state_, o.shared_state_);
   }
   friend void swap(Future& a, Future& b) noexcept { a.swap(b); }
   ///@}

   ///@{ @name getters
   /** @brief True iff the Future is still associated with some Promise. */
   bool valid() const noexcept { return shared_state_ != nullptr; }

   /** @brief True iff the Future's value is set and can be retrieved without blocking. */
   bool is_ready() const { return valid() && shared_state_->is_ready(); }

   /** @brief True iff the Future contains an exception which will be thrown when calling get(). */
   bool has_exception() const
   {
      check_state_();
      return shared_state_->has_exception_ptr();
   }
   ///@}

   /**
    * @brief Gets the result of the Future, performing a blocking wait if not yet set.
    *
    * Releases the shared state, so `valid() == false` afterwards.
    *
    * @exception std::future_error `no_state` if the shared state has already been ejected.
    * @exception ... Rethrows any exception set on the associated Promise.
    */
   R get()
   {
      check_state_();
      std::shared_ptr<shared_state_type> shared_state{nullptr};
      std::swap(shared_state_, shared_state); // release shared state
      return shared_state->get();
   }

   ///@{ @name wait
   void wait() const
   {
      check_state_();
      shared_state_->wait();
   }

   template<typename Rep, typename Period>
   std::future_status wait_for(const std::chrono::duration<Rep, Period>& duration) const
   {
      check_state_();
      return shared_state_->wait_for(duration);
   }
   ///@}

   ///@{ @name continuations
   /**
    * @brief Execute `f(ready_future)` on `executor` once the value (or exception) is set.
    *
    * The Future is consumed: `valid() == false` afterwards. `f` is handed a ready Future
    * and decides itself whether to call `get()`, so exceptions are observed rather than
    * propagated.
    */
   template<typename Executor, typename F> void on_ready(const Executor& executor, F&& f)
   {
      check_state_();
      auto shared_state = std::move(shared_state_);
      auto* raw_state   = shared_state.get();
      // `f` may be move-only, and the continuation is stored in a std::function
      auto work = std::make_shared<std::decay_t<F>>(std::forward<F>(f));
      // The thunk only runs while the setter (or this call) holds a strong reference.
      raw_state->on_ready([executor, raw_state, work]() {
         executor.execute([state = raw_state->shared_from_this(), work]() mutable {
            (*work)(Future<R>{adopt_tag{}, std::move(state)});
         });
      });
   }

   /**
    * @brief Execute `f(value)` on `executor` when the value is set, returning a Future for the
    * result of `f`. Exceptions (from this Future or from `f`) propagate into the returned Future.
    */
   template<typename Executor,
            typename F,
            typename T = typename detail::continuation_result<F, R>::type>
   Future<T> then(const Executor& executor, F&& f);
   ///@}

   /// @private
   struct adopt_tag
   {};

   /// @private
   Future(adopt_tag, std::shared_ptr<shared_state_type> shared_state) noexcept
       : shared_state_{std::move(shared_state)}
   {}
};

// ----------------------------------------------------------------------------------------- Promise

/**
 * @ingroup async
 * @brief Stores a value or exception for later asychronous retrieval.
 */
template<typename R> class Promise final
{
 private:
   using shared_state_type = detail::PromiseFutureSharedState<R>;
   std::shared_ptr<shared_state_type> shared_state_{};

   void check_state_() const
   {
      if(!valid()) throw std::future_error{std::future_errc::no_state};
   }

 public:
   Promise()
       : shared_state_{std::make_shared<shared_state_type>()}
   {}
   Promise(Promise&& o) noexcept = default;
   Promise(const Promise&)       = delete;
   ~Promise()                    = default;
   Promise& operator=(Promise&& o) noexcept = default;
   Promise& operator=(const Promise&) = delete;

   void swap(Promise& o) noexcept
   {
      using std::swap;
      swap(shared_state_, o.shared_state_);
   }
   friend void swap(Promise& a, Promise& b) noexcept { a.swap(b); }

   bool valid() const noexcept { return shared_state_ != nullptr; }

   Future<R> get_future()
   {
      check_state_();
      return Future<R>{shared_state_};
   }

   template<typename T = R> std::enable_if_t<!std::is_same_v<T, void>, void> set_value(T&& value)
   {
      check_state_();
      shared_state_->set_value(std::forward<T>(value));
   }

   template<typename T = R> std::enable_if_t<std::is_same_v<T, void>, void> set_value()
   {
      check_state_();
      shared_state_->set_value();
   }

   void set_exception(std::exception_ptr ex)
   {
      check_state_();
      shared_state_->set_exception_ptr(ex);
   }
};

// -------------------------------------------------------------------------------------------- then

template<typename R>
template<typename Executor, typename F, typename T>
Future<T> Future<R>::then(const Executor& executor, F&& f)
{
   Promise<T> promise;
   auto future = promise.get_future();
   on_ready(executor,
            [promise = std::move(promise), f = std::forward<F>(f)](Future<R> ready) mutable {
               try {
                  if constexpr(std::is_void_v<R> && std::is_void_v<T>) {
                     ready.get();
                     f();
                     promise.set_value();
                  } else if constexpr(std::is_void_v<R>) {
                     ready.get();
                     promise.set_value(f());
                  } else if constexpr(std::is_void_v<T>) {
                     f(ready.get());
                     promise.set_value();
                  } else {
                     promise.set_value(f(ready.get()));
                  }
               } catch(...) {
                  promise.set_exception(std::current_exception());
               }
            });
   return future;
}

// ------------------------------------------------------------------------------ ready futures

template<typename R> Future<R> make_ready_future(R value)
{
   Promise<R> promise;
   auto future = promise.get_future();
   promise.set_value(std::move(value));
   return future;
}

template<typename R> Future<R> make_exceptional_future(std::exception_ptr ex_ptr)
{
   Promise<R> promise;
   auto future = promise.get_future();
   promise.set_exception(ex_ptr);
   return future;
}

} // namespace courier::async
