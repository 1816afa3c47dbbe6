#pragma once

#include <memory>
#include <string>
#include <cstdint>
#include <utility>
#include <optional>

#include <boost/asio/awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <grab/http/http-transport.hxx>
#include <grab/transfer/transfer-io.hxx>
#include <grab/download/download-error.hxx>
#include <grab/download/download-types.hxx>
#include <grab/download/download-response.hxx>

namespace grab
{
  namespace asio = boost::asio;

  // Download state machine.
  //
  // Drives a single response from creation to completion. Each step returns
  // the next one and every failure leads straight to finalize, which is the
  // only place the response is completed. The response scope is checked
  // before every step so a canceled transfer stops at the next step boundary
  // (or at the next read, see transfer::copy()).
  //
  class state_machine
  {
  public:
    state_machine (std::shared_ptr<response>,
                   std::shared_ptr<http_transport>,
                   const client_traits&);

    state_machine (const state_machine&) = delete;
    state_machine& operator= (const state_machine&) = delete;

    // Run to completion. Never throws for transfer failures: they end up in
    // the response.
    //
    asio::awaitable<void>
    run ();

  private:
    asio::awaitable<download_state>
    resolve_destination ();

    asio::awaitable<download_state>
    probe_remote ();

    asio::awaitable<download_state>
    issue_transfer ();

    download_state
    open_writer ();

    asio::awaitable<download_state>
    stream ();

    download_state
    verify_checksum ();

    void
    finalize () noexcept;

    // Record the terminal error and return the finalize step.
    //
    download_state
    fail (boost::system::error_code, std::string message = std::string ());

    http_request
    make_request (http_method) const;

    void
    record (const http_stream&);

    bool
    tracing () const noexcept
    {
      return traits_.verbosity >= 2;
    }

  private:
    std::shared_ptr<response> r_;
    std::shared_ptr<http_transport> transport_;
    client_traits traits_;

    std::optional<download_error> error_;

    std::string url_;                       // Effective URL.
    bool probed_ = false;                   // HEAD request done.
    bool exists_ = false;                   // Destination file exists.
    bool ranges_ = true;                    // Server accepts range requests.
    std::optional<std::uint64_t> expected_; // Total size, if known.

    std::unique_ptr<reader> body_;
    std::unique_ptr<writer> writer_;
  };
}
