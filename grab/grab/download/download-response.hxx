#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <filesystem>

#include <grab/http/http-types.hxx>
#include <grab/transfer/transfer-io.hxx>
#include <grab/transfer/transfer-scope.hxx>
#include <grab/download/download-error.hxx>
#include <grab/download/download-request.hxx>

namespace grab
{
  // Download response.
  //
  // Represents a single transfer attempt. It is created by the client and
  // populated by the download state machine that runs it. Until the transfer
  // completes only the progress accessors (bytes_complete(), size(),
  // progress(), etc) may be used from other threads. Everything else becomes
  // readable (and stays immutable) once the response is complete, that is,
  // after wait() returns or is_complete() returns true.
  //
  class response
  {
  public:
    using clock = std::chrono::system_clock;

    // The transfer runs under a child scope of the specified scope which is
    // normally the request's scope (possibly linked with a batch scope).
    //
    response (grab::request, const cancel_scope&);

    response (const response&) = delete;
    response& operator= (const response&) = delete;

    const grab::request&
    request () const noexcept
    {
      return request_;
    }

    // Completion.
    //
    bool
    is_complete () const noexcept
    {
      return complete_.load (std::memory_order_acquire);
    }

    // Block until the transfer completes and return its terminal error, if
    // any. Must not be called from the client's own executor.
    //
    const std::optional<download_error>&
    wait () const;

    // Return true if the transfer completed within the specified time.
    //
    template <typename R, typename P>
    bool
    wait_for (const std::chrono::duration<R, P>& d) const
    {
      return done_.wait_for (d) == std::future_status::ready;
    }

    // Return the terminal error if the transfer completed and failed.
    //
    std::optional<download_error>
    err () const;

    // Cancel the transfer and wait for it to complete.
    //
    void
    cancel ();

    // Progress. Safe to call at any time.
    //
    std::uint64_t
    bytes_complete () const noexcept
    {
      return bytes_resumed_.load (std::memory_order_relaxed) +
             transferred_.load (std::memory_order_relaxed);
    }

    // Expected total size or 0 if unknown.
    //
    std::uint64_t
    size () const noexcept
    {
      return size_.load (std::memory_order_relaxed);
    }

    // Ratio of bytes_complete() to size() or 0 if the size is unknown.
    //
    double
    progress () const noexcept;

    clock::time_point
    start () const noexcept
    {
      return start_;
    }

    // Time elapsed since start (until the end once complete).
    //
    clock::duration
    duration () const noexcept;

    // Average transfer rate of this attempt (resumed bytes don't count).
    //
    double
    bytes_per_second () const noexcept;

    // Estimated completion time (the end time once complete, the current
    // time if it cannot be estimated).
    //
    clock::time_point
    eta () const noexcept;

    // The following are only meaningful once the transfer is complete.
    //
    clock::time_point
    end () const noexcept
    {
      return end_;
    }

    const std::filesystem::path&
    filename () const noexcept
    {
      return filename_;
    }

    bool
    did_resume () const noexcept
    {
      return did_resume_;
    }

    std::uint64_t
    bytes_resumed () const noexcept
    {
      return bytes_resumed_.load (std::memory_order_relaxed);
    }

    // Status and headers of the last server response (0 and empty if the
    // server was never contacted).
    //
    std::uint16_t
    status () const noexcept
    {
      return status_;
    }

    const http_headers&
    headers () const noexcept
    {
      return headers_;
    }

    // Wait for completion and return the content: the memory buffer if the
    // request had no_store set and the destination file's content
    // otherwise. Throw boost::system::system_error if the transfer failed or
    // the file cannot be read.
    //
    std::string
    bytes () const;

  private:
    friend class client;
    friend class state_machine;

    // Assign the terminal error and close the completion gate. Only the
    // first call has any effect.
    //
    void
    complete (std::optional<download_error>);

  private:
    const grab::request request_;
    const cancel_scope scope_;
    const clock::time_point start_;

    clock::time_point end_;
    std::filesystem::path filename_;
    bool did_resume_ = false;
    std::uint16_t status_ = 0;
    http_headers headers_;
    std::string content_;

    std::atomic<std::uint64_t> bytes_resumed_ {0};
    std::atomic<std::uint64_t> size_ {0};
    std::atomic<std::uint64_t> transferred_ {0};

    std::optional<download_error> error_;

    std::atomic<bool> closed_ {false};
    std::atomic<bool> complete_ {false};
    std::promise<void> promise_;
    std::shared_future<void> done_;
  };
}
