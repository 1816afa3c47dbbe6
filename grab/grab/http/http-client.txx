#include <limits>
#include <chrono>
#include <optional>
#include <stdexcept>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/redirect_error.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace grab
{
  namespace http = beast::http;
  using tcp = asio::ip::tcp;

  // Arm the stream timer for the next operation.
  //
  // The expiry is the operation timeout or the scope deadline, whichever
  // comes first. Note that this is the only way a deadline can interrupt an
  // operation that is already in flight.
  //
  template <typename L>
  inline void
  arm_timeout (L& layer, std::uint32_t ms, const cancel_scope& scope)
  {
    using clock = std::chrono::steady_clock;

    std::optional<clock::time_point> t;

    if (ms != 0)
      t = clock::now () + std::chrono::milliseconds (ms);

    if (auto d = scope.deadline (); d && (!t || *d < *t))
      t = d;

    if (t)
      layer.expires_at (*t);
    else
      layer.expires_never ();
  }

  // Host header value (port only if non-default).
  //
  inline std::string
  host_field (const http_url& u)
  {
    bool def ((u.scheme == "http"  && u.port == "80") ||
              (u.scheme == "https" && u.port == "443"));

    std::string h (u.host.find (':') != std::string::npos
                   ? '[' + u.host + ']'
                   : u.host);

    return def ? h : h + ':' + u.port;
  }

  // Response body reader.
  //
  // Owns the connection and the parser that has already consumed the
  // response head. The body is parsed straight into the caller's buffer.
  //
  template <typename Stream>
  class http_body_reader: public reader
  {
  public:
    using parser_type = http::response_parser<http::buffer_body>;

    http_body_reader (std::unique_ptr<Stream> s,
                      std::unique_ptr<parser_type> p,
                      beast::flat_buffer b,
                      std::uint32_t timeout,
                      cancel_scope scope)
        : stream_ (std::move (s)),
          parser_ (std::move (p)),
          buffer_ (std::move (b)),
          timeout_ (timeout),
          scope_ (std::move (scope)) {}

    ~http_body_reader () override
    {
      close ();
    }

    asio::awaitable<std::size_t>
    read_some (asio::mutable_buffer b, boost::system::error_code& ec) override
    {
      ec = boost::system::error_code ();

      // Note that a read may consume only framing (chunk headers and such)
      // without producing any body bytes so keep going until we've got some
      // or the message is complete.
      //
      while (!parser_->is_done ())
      {
        auto& body (parser_->get ().body ());
        body.data = b.data ();
        body.size = b.size ();

        // Reset the timeout to keep the connection alive while data flows.
        //
        arm_timeout (beast::get_lowest_layer (*stream_), timeout_, scope_);

        co_await http::async_read_some (
          *stream_, buffer_, *parser_,
          asio::redirect_error (asio::use_awaitable, ec));

        std::size_t n (b.size () - body.size);

        // The buffer is full which is what we are after.
        //
        if (ec == http::error::need_buffer)
          ec = boost::system::error_code ();

        // Many servers close TLS connections without sending close_notify.
        // If the body is delimited by the end of the connection, that's how
        // it ends.
        //
        if (ec == asio::ssl::error::stream_truncated && parser_->need_eof ())
        {
          boost::system::error_code e;
          parser_->put_eof (e);

          ec = e ? e : boost::system::error_code (asio::error::eof);
        }

        if (n != 0 || ec)
          co_return n;
      }

      ec = asio::error::eof;
      co_return 0;
    }

    void
    close () noexcept override
    {
      if (stream_ == nullptr)
        return;

      // We don't wait for a graceful TLS shutdown: many servers don't send
      // close_notify properly and waiting for it can block until timeout.
      // Errors are of no interest at this point.
      //
      beast::error_code ec;
      auto& s (beast::get_lowest_layer (*stream_).socket ());
      s.shutdown (tcp::socket::shutdown_both, ec);
      s.close (ec);

      stream_.reset ();
    }

  private:
    std::unique_ptr<Stream> stream_;
    std::unique_ptr<parser_type> parser_;
    beast::flat_buffer buffer_;
    std::uint32_t timeout_;
    cancel_scope scope_;
  };

  // Perform a request following redirects.
  //
  template <typename T>
  asio::awaitable<http_stream> basic_http_client<T>::
  perform_impl (http_request req,
                const cancel_scope& scope,
                std::uint8_t redirects)
  {
    if (auto e = scope.error ())
      throw boost::system::system_error (e);

    http_url u (parse_url (req.url));

    if (u.scheme != "http" && u.scheme != "https")
      throw std::invalid_argument ("unsupported protocol scheme '" +
                                   u.scheme + "'");

    auto ex (co_await asio::this_coro::executor);

    tcp::resolver rslv (ex);
    auto addrs (co_await rslv.async_resolve (u.host,
                                             u.port,
                                             asio::use_awaitable));

    http_stream r;

    // Depending on the scheme, we either instantiate a plain TCP stream or an
    // SSL stream. For SSL we must perform the handshake before we can start
    // talking HTTP.
    //
    if (u.secure ())
    {
      using stream_type = beast::ssl_stream<beast::tcp_stream>;

      auto s (std::make_unique<stream_type> (ex, ssl_ctx_));

      // We must set the SNI hostname, otherwise many modern servers (like
      // Cloudflare) will reject the handshake. Beast doesn't wrap this so
      // drop down to the OpenSSL API.
      //
      if (!SSL_set_tlsext_host_name (s->native_handle (), u.host.c_str ()))
      {
        beast::error_code ec (static_cast<int> (::ERR_get_error ()),
                              asio::error::get_ssl_category ());
        throw beast::system_error (ec, "unable to set SNI hostname");
      }

      if (traits_.verify_ssl)
        s->set_verify_callback (ssl::host_name_verification (u.host));

      auto& layer (beast::get_lowest_layer (*s));
      arm_timeout (layer, traits_.connect_timeout, scope);

      co_await layer.async_connect (addrs, asio::use_awaitable);
      co_await s->async_handshake (ssl::stream_base::client,
                                   asio::use_awaitable);

      r = co_await exchange (std::move (s), req, u, scope);
    }
    else
    {
      auto s (std::make_unique<beast::tcp_stream> (ex));

      arm_timeout (*s, traits_.connect_timeout, scope);
      co_await s->async_connect (addrs, asio::use_awaitable);

      r = co_await exchange (std::move (s), req, u, scope);
    }

    // Handle redirects (3xx) by recursing with the new location. We keep the
    // method and headers (all we send is GET and HEAD anyway).
    //
    if (traits_.follow_redirects && r.is_redirection ())
    {
      if (auto loc = r.location ())
      {
        if (redirects >= traits_.max_redirects)
          throw std::runtime_error ("maximum redirects exceeded");

        (*r.body)->close ();

        http_request next (req.method,
                           resolve_url (u, *loc),
                           req.headers,
                           req.version);

        co_return co_await perform_impl (std::move (next),
                                         scope,
                                         redirects + 1);
      }
    }

    co_return r;
  }

  // Send the request and read the response head, leaving the body on the
  // connection.
  //
  template <typename T>
  template <typename Stream>
  asio::awaitable<http_stream> basic_http_client<T>::
  exchange (std::unique_ptr<Stream> s,
            const http_request& req,
            const http_url& u,
            const cancel_scope& scope)
  {
    using reader_type = http_body_reader<Stream>;
    using parser_type = typename reader_type::parser_type;

    // Note that we need to access the lowest layer (the TCP stream) to set
    // timeouts, regardless of whether there is an SSL layer on top.
    //
    auto& layer (beast::get_lowest_layer (*s));

    http::request<http::empty_body> br;
    br.method (req.method == http_method::head
               ? http::verb::head
               : http::verb::get);
    br.target (u.target);
    br.version (req.version.packed ());
    br.set (http::field::host, host_field (u));

    for (const auto& h: req.headers)
      br.set (h.name, h.value);

    arm_timeout (layer, traits_.request_timeout, scope);
    co_await http::async_write (*s, br, asio::use_awaitable);

    beast::flat_buffer b;
    auto p (std::make_unique<parser_type> ());
    p->body_limit (std::numeric_limits<std::uint64_t>::max ());

    // A response to HEAD has the headers of the GET response but never a
    // body so tell the parser not to expect one.
    //
    if (req.method == http_method::head)
      p->skip (true);

    co_await http::async_read_header (*s, b, *p, asio::use_awaitable);

    const auto& m (p->get ());

    http_stream r;
    r.status  = static_cast<std::uint16_t> (m.result_int ());
    r.version = http_version (m.version () / 10, m.version () % 10);
    r.reason  = std::string (m.reason ());
    r.url     = req.url;

    for (const auto& f: m)
      r.headers.add (std::string (f.name_string ()), std::string (f.value ()));

    r.body = std::make_unique<reader_type> (std::move (s),
                                            std::move (p),
                                            std::move (b),
                                            traits_.request_timeout,
                                            scope);
    co_return r;
  }
}
