#pragma once

#include <atomic>
#include <memory>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <grab/transfer/transfer-io.hxx>
#include <grab/transfer/transfer-scope.hxx>
#include <grab/transfer/transfer-limiter.hxx>

namespace grab
{
  // Streaming copy from a reader to a writer.
  //
  // The number of bytes written is added to a caller-supplied counter after
  // every write so that it can be observed concurrently (progress reporting)
  // without synchronizing with the copy loop.
  //
  class transfer
  {
  public:
    static constexpr std::size_t default_buffer_size = 32 * 1024;

    // If buffer_size is 0, use default_buffer_size. The limiter may be null
    // (unthrottled).
    //
    transfer (cancel_scope,
              std::shared_ptr<rate_limiter>,
              writer&,
              reader&,
              std::size_t buffer_size,
              std::atomic<std::uint64_t>& counter);

    transfer (const transfer&) = delete;
    transfer& operator= (const transfer&) = delete;

    // Copy until the end of the stream, the first error, or cancellation.
    // Return the number of bytes written by this call and the terminal error
    // (empty on clean completion). Bytes already written are never rolled
    // back.
    //
    asio::awaitable<std::pair<std::uint64_t, boost::system::error_code>>
    copy ();

    // Bytes written so far. Safe to call concurrently with copy().
    //
    std::uint64_t
    n () const noexcept
    {
      return counter_.load (std::memory_order_relaxed);
    }

  private:
    cancel_scope scope_;
    std::shared_ptr<rate_limiter> limiter_;
    writer& writer_;
    reader& reader_;
    std::vector<char> buffer_;
    std::atomic<std::uint64_t>& counter_;
  };
}
