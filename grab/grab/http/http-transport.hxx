#pragma once

#include <utility>

#include <boost/asio/awaitable.hpp>

#include <grab/http/http-request.hxx>
#include <grab/http/http-response.hxx>
#include <grab/transfer/transfer-scope.hxx>

namespace grab
{
  namespace asio = boost::asio;

  // HTTP transport.
  //
  // Perform a request and return as soon as the response head has been
  // received, with the body left to be read through the response's reader
  // (for HEAD requests the reader is at EOF straight away). Redirects are
  // handled by the transport and the response carries the effective URL.
  //
  // A failure to obtain a response (resolution, connection, TLS, protocol
  // errors) is reported by throwing, normally boost::system::system_error.
  // An error status is not a failure as far as the transport is concerned.
  //
  // Implementations must be safe to use from multiple coroutines at once.
  //
  class http_transport
  {
  public:
    virtual
    ~http_transport () = default;

    virtual asio::awaitable<http_stream>
    perform (http_request, cancel_scope) = 0;
  };
}
