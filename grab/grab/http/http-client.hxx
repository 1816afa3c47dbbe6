#pragma once

#include <string>
#include <memory>
#include <cstdint>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>

#include <grab/http/http-url.hxx>
#include <grab/http/http-types.hxx>
#include <grab/http/http-request.hxx>
#include <grab/http/http-response.hxx>
#include <grab/http/http-transport.hxx>

namespace grab
{
  namespace asio  = boost::asio;
  namespace beast = boost::beast;
  namespace ssl   = boost::asio::ssl;

  // HTTP client options.
  //
  template <typename S = std::string>
  struct http_client_traits
  {
    using string_type = S;

    // Connection timeout in milliseconds (0 = no timeout).
    //
    std::uint32_t connect_timeout = 30000;

    // Timeout for sending the request and for each subsequent read, in
    // milliseconds (0 = no timeout). Note that this is an inactivity timeout,
    // not a limit on the total transfer time.
    //
    std::uint32_t request_timeout = 60000;

    // Maximum number of redirects to follow.
    //
    std::uint8_t max_redirects = 10;

    // Whether to automatically follow redirects.
    //
    bool follow_redirects = true;

    // Whether to verify the server certificate (and host name).
    //
    bool verify_ssl = false;

    // CA certificate file path (empty = use system defaults).
    //
    string_type ssl_cert_file;
  };

  // HTTP/HTTPS transport based on Boost.Beast.
  //
  // Each request opens a fresh connection which is then owned by the
  // returned body reader. Streams are created on the calling coroutine's
  // executor which must therefore be a strand (or single-threaded) for the
  // timeouts to be safe.
  //
  template <typename T = http_client_traits<>>
  class basic_http_client: public http_transport
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    explicit
    basic_http_client (const traits_type& traits = traits_type ())
        : traits_ (traits), ssl_ctx_ (ssl::context::tlsv12_client)
    {
      configure_ssl ();
    }

    basic_http_client (const basic_http_client&) = delete;
    basic_http_client& operator= (const basic_http_client&) = delete;

    const traits_type&
    traits () const noexcept
    {
      return traits_;
    }

    asio::awaitable<http_stream>
    perform (http_request, cancel_scope) override;

  private:
    void
    configure_ssl ();

    asio::awaitable<http_stream>
    perform_impl (http_request, const cancel_scope&, std::uint8_t redirects);

    template <typename Stream>
    asio::awaitable<http_stream>
    exchange (std::unique_ptr<Stream>,
              const http_request&,
              const http_url&,
              const cancel_scope&);

  private:
    traits_type traits_;
    ssl::context ssl_ctx_;
  };

  using http_client = basic_http_client<>;
}

#include <grab/http/http-client.ixx>
#include <grab/http/http-client.txx>
