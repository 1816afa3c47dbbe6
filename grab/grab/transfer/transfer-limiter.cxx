#include <grab/transfer/transfer-limiter.hxx>

#include <algorithm>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>

using namespace std;
using namespace std::chrono;

namespace grab
{
  using boost::system::error_code;

  milliseconds bandwidth_limiter::
  reserve (size_t n)
  {
    lock_guard<mutex> l (mutex_);

    auto now (clock::now ());

    if (!start_)
      start_ = now;

    window_ += n;

    auto el (duration_cast<milliseconds> (now - *start_).count ());
    auto exp (static_cast<int64_t> ((window_ * 1000) / rate_));

    // Reset the accounting window every second to prevent drift.
    //
    if (el >= 1000)
    {
      start_ = now;
      window_ = 0;
    }

    return el < exp ? milliseconds (exp - el) : milliseconds (0);
  }

  asio::awaitable<error_code> bandwidth_limiter::
  wait_n (const cancel_scope& s, size_t n)
  {
    if (auto e = s.error ())
      co_return e;

    if (rate_ == 0 || n == 0)
      co_return error_code ();

    milliseconds d (reserve (n));

    // We are running ahead of schedule so throttle. Sleep in slices so that
    // cancellation is noticed reasonably quickly even for long waits.
    //
    asio::steady_timer t (co_await asio::this_coro::executor);

    while (d.count () > 0)
    {
      milliseconds w (min (d, milliseconds (100)));

      t.expires_after (w);

      error_code ec;
      co_await t.async_wait (asio::redirect_error (asio::use_awaitable, ec));

      if (ec && ec != asio::error::operation_aborted)
        co_return ec;

      if (auto e = s.error ())
        co_return e;

      d -= w;
    }

    co_return error_code ();
  }
}
