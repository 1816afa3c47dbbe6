#pragma once

#include <mutex>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <grab/transfer/transfer-scope.hxx>

namespace grab
{
  namespace asio = boost::asio;

  // Transfer rate limiter.
  //
  // The copy loop calls wait_n() after every chunk it has written passing the
  // chunk size. The limiter suspends the caller for as long as the policy
  // requires and returns an error only if the scope got canceled while
  // waiting (or the limiter itself failed). The policy is entirely up to the
  // implementation.
  //
  class rate_limiter
  {
  public:
    virtual
    ~rate_limiter () = default;

    virtual asio::awaitable<boost::system::error_code>
    wait_n (const cancel_scope&, std::size_t n) = 0;
  };

  // Fixed window bandwidth limiter.
  //
  // Bytes are accounted in one second windows: whenever the bytes seen in the
  // current window run ahead of the allowed rate, the caller is put to sleep
  // until the schedule catches up. An instance may be shared between
  // transfers in which case the limit applies to their combined throughput.
  //
  class bandwidth_limiter: public rate_limiter
  {
  public:
    using clock = std::chrono::steady_clock;

    // Zero bytes per second means unlimited.
    //
    explicit
    bandwidth_limiter (std::uint64_t bytes_per_second)
        : rate_ (bytes_per_second) {}

    asio::awaitable<boost::system::error_code>
    wait_n (const cancel_scope&, std::size_t) override;

    std::uint64_t
    rate () const noexcept
    {
      return rate_;
    }

  private:
    // Account for n bytes and return how long the caller must wait.
    //
    std::chrono::milliseconds
    reserve (std::size_t n);

  private:
    const std::uint64_t rate_;

    std::mutex mutex_;
    std::optional<clock::time_point> start_; // Current window start.
    std::uint64_t window_ = 0;                // Bytes in current window.
  };
}
