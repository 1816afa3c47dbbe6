#pragma once

#include <deque>
#include <mutex>
#include <chrono>
#include <memory>
#include <vector>
#include <utility>
#include <optional>
#include <algorithm>
#include <stdexcept>
#include <condition_variable>

#include <boost/asio/post.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>

#include <grab/transfer/transfer-scope.hxx>

namespace grab
{
  namespace asio = boost::asio;

  // Unbounded multi-producer, multi-consumer queue with close semantics.
  //
  // Values can be received by blocking threads (receive()) as well as by
  // coroutines (async_receive()). A closed channel still delivers the values
  // queued before it was closed.
  //
  template <typename T>
  class channel
  {
  public:
    using value_type = T;

    channel () = default;

    channel (const channel&) = delete;
    channel& operator= (const channel&) = delete;

    // Throw std::logic_error if the channel is closed.
    //
    void
    send (value_type v)
    {
      {
        std::lock_guard<std::mutex> l (mutex_);

        if (closed_)
          throw std::logic_error ("send on closed channel");

        queue_.push_back (std::move (v));
      }

      notify ();
    }

    void
    close () noexcept
    {
      {
        std::lock_guard<std::mutex> l (mutex_);
        closed_ = true;
      }

      notify ();
    }

    bool
    closed () const
    {
      std::lock_guard<std::mutex> l (mutex_);
      return closed_;
    }

    // Block until a value is available. Return nullopt once the channel is
    // closed and drained.
    //
    std::optional<value_type>
    receive ()
    {
      std::unique_lock<std::mutex> l (mutex_);
      cv_.wait (l, [this] {return !queue_.empty () || closed_;});
      return pop ();
    }

    std::optional<value_type>
    try_receive ()
    {
      std::lock_guard<std::mutex> l (mutex_);
      return pop ();
    }

    // Suspend until a value is available, the channel is closed and drained,
    // or the scope is canceled (the last two return nullopt). Once the scope
    // is canceled nothing more is handed out, even if values are queued.
    //
    // The coroutine waits on a timer that send() and close() cancel. The
    // timer never sleeps longer than a slice so that scope cancellation,
    // which has no way to wake us up, is noticed reasonably quickly.
    //
    asio::awaitable<std::optional<value_type>>
    async_receive (const cancel_scope& s)
    {
      auto ex (co_await asio::this_coro::executor);

      for (;;)
      {
        auto t (std::make_shared<asio::steady_timer> (ex));

        {
          std::lock_guard<std::mutex> l (mutex_);

          if (s.canceled ())
            co_return std::nullopt;

          if (!queue_.empty () || closed_)
            co_return pop ();

          t->expires_after (slice);
          waiters_.push_back (t);
        }

        boost::system::error_code ec;
        co_await t->async_wait (asio::redirect_error (asio::use_awaitable, ec));

        // If the slice simply ran out, we are still registered.
        //
        std::lock_guard<std::mutex> l (mutex_);
        waiters_.erase (std::remove (waiters_.begin (), waiters_.end (), t),
                        waiters_.end ());
      }
    }

  private:
    static constexpr std::chrono::milliseconds slice {50};

    // Must be called with the mutex held.
    //
    std::optional<value_type>
    pop ()
    {
      if (queue_.empty ())
        return std::nullopt;

      std::optional<value_type> r (std::move (queue_.front ()));
      queue_.pop_front ();
      return r;
    }

    // Wake up everyone waiting. Timers are not thread-safe so each one is
    // canceled on its own executor.
    //
    void
    notify ()
    {
      std::vector<std::shared_ptr<asio::steady_timer>> ws;

      {
        std::lock_guard<std::mutex> l (mutex_);
        ws.swap (waiters_);
      }

      cv_.notify_all ();

      for (auto& t: ws)
        asio::post (t->get_executor (), [t] {t->cancel ();});
    }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<value_type> queue_;
    std::vector<std::shared_ptr<asio::steady_timer>> waiters_;
    bool closed_ = false;
  };
}
