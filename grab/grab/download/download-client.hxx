#pragma once

#include <memory>
#include <vector>
#include <utility>
#include <optional>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/any_io_executor.hpp>

#include <grab/http/http-transport.hxx>
#include <grab/transfer/transfer-scope.hxx>
#include <grab/download/download-types.hxx>
#include <grab/download/download-channel.hxx>
#include <grab/download/download-request.hxx>
#include <grab/download/download-response.hxx>

namespace grab
{
  namespace asio = boost::asio;

  using response_channel = channel<std::shared_ptr<response>>;
  using request_channel  = channel<request>;

  // Download client.
  //
  // Holds the configuration shared by all transfers (transport, user agent,
  // buffer size) and runs them on an executor. The configuration is
  // read-only after construction so a single client can be used by any
  // number of threads. Each transfer runs on its own strand.
  //
  // The client must outlive the transfers it started. If it owns its thread
  // pool, the destructor waits for them to finish.
  //
  class client
  {
  public:
    // Use the Beast-based HTTP client on an internal thread pool.
    //
    client ();

    explicit
    client (std::shared_ptr<http_transport>, client_traits = client_traits ());

    // Use an external executor.
    //
    client (asio::any_io_executor,
            std::shared_ptr<http_transport>,
            client_traits = client_traits ());

    ~client ();

    client (const client&) = delete;
    client& operator= (const client&) = delete;

    const client_traits&
    traits () const noexcept
    {
      return traits_;
    }

    const asio::any_io_executor&
    executor () const noexcept
    {
      return ex_;
    }

    // Start the transfer and return its response right away. The transfer
    // runs under the request's scope.
    //
    std::shared_ptr<response>
    do_request (request) const;

    // Run requests received from the input channel one at a time until it is
    // closed (and drained) or the scope is canceled, sending each response
    // to the output channel once it is complete. The output channel is not
    // closed.
    //
    // Must be run on a strand (or another serializing executor).
    //
    asio::awaitable<void>
    do_channel (cancel_scope,
                request_channel& in,
                response_channel& out) const;

    // Run the requests on the specified number of workers, each following
    // the do_channel() pattern. If the number is less than 1, start a worker
    // per request. The returned channel delivers the responses in completion
    // order and is closed once all the workers are done.
    //
    std::shared_ptr<response_channel>
    do_batch (cancel_scope, int workers, std::vector<request>) const;

  private:
    void
    spawn (std::shared_ptr<response>) const;

  private:
    std::optional<asio::thread_pool> pool_;
    asio::any_io_executor ex_;
    std::shared_ptr<http_transport> transport_;
    client_traits traits_;
  };

  // Client used by the free-standing convenience functions.
  //
  client&
  default_client ();
}
