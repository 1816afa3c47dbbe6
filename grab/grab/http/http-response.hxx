#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

#include <grab/http/http-types.hxx>
#include <grab/transfer/transfer-io.hxx>

namespace grab
{
  // HTTP response.
  //
  // The body type is either a complete in-memory representation or, for
  // streamed transfers, a reader positioned at the start of the body (see
  // http_stream below).
  //
  template <typename S, typename B = S>
  class basic_http_response
  {
  public:
    using string_type  = S;
    using body_type    = B;
    using headers_type = basic_http_headers<string_type>;

    std::uint16_t            status = 0;
    http_version             version;
    string_type              reason;
    headers_type             headers;
    std::optional<body_type> body;

    // Effective URL, that is, after following redirects.
    //
    string_type url;

    basic_http_response () = default;

    basic_http_response (std::uint16_t s, headers_type h)
        : status (s), headers (std::move (h)) {}

    bool
    is_success () const noexcept
    {
      return grab::is_success (status);
    }

    bool
    is_redirection () const noexcept
    {
      return grab::is_redirection (status);
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    std::optional<string_type>
    location () const
    {
      return get_header (string_type ("Location"));
    }

    // Content-Length header value, nullopt if absent or invalid.
    //
    std::optional<std::uint64_t>
    content_length () const;

    // First byte position of the Content-Range header, nullopt if absent or
    // invalid. For example, 50 for "bytes 50-199/200".
    //
    std::optional<std::uint64_t>
    content_range_start () const;

    // Return false if the server explicitly declared that it does not
    // support range requests (Accept-Ranges: none).
    //
    bool
    accepts_ranges () const;
  };

  template <typename S, typename B>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_http_response<S, B>& r) -> decltype (o)
  {
    o << r.version << ' ' << r.status;

    if (!r.reason.empty ())
      o << ' ' << r.reason;

    return o;
  }

  using http_response = basic_http_response<std::string, std::string>;

  // Response with the body left on the wire.
  //
  using http_stream = basic_http_response<std::string,
                                          std::unique_ptr<reader>>;
}

#include <grab/http/http-response.ixx>
