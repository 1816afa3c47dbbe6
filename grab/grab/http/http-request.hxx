#pragma once

#include <string>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

#include <grab/http/http-types.hxx>

namespace grab
{
  // HTTP request.
  //
  // Requests never carry a body: all we do is GET and HEAD.
  //
  template <typename S>
  class basic_http_request
  {
  public:
    using string_type  = S;
    using headers_type = basic_http_headers<string_type>;

    http_method  method;
    string_type  url;
    http_version version;
    headers_type headers;

    basic_http_request () = default;

    basic_http_request (http_method m,
                        string_type u,
                        http_version v = http_version (1, 1))
        : method (m), url (std::move (u)), version (v) {}

    basic_http_request (http_method m,
                        string_type u,
                        headers_type h,
                        http_version v = http_version (1, 1))
        : method (m),
          url (std::move (u)),
          version (v),
          headers (std::move (h)) {}

    void
    set_header (string_type name, string_type value)
    {
      headers.set (std::move (name), std::move (value));
    }

    std::optional<string_type>
    get_header (const string_type& name) const
    {
      return headers.get (name);
    }

    void
    set_user_agent (string_type ua)
    {
      set_header (string_type ("User-Agent"), std::move (ua));
    }

    // Request the content starting at the specified offset.
    //
    // Note that the Range header end is inclusive and we leave it open so
    // that we get everything after the offset.
    //
    void
    set_range (std::uint64_t offset)
    {
      set_header (string_type ("Range"),
                  string_type ("bytes=") + std::to_string (offset) + "-");
    }
  };

  template <typename S>
  inline auto
  operator<< (std::basic_ostream<typename S::value_type>& o,
              const basic_http_request<S>& r) -> decltype (o)
  {
    return o << r.method << ' ' << r.url << ' ' << r.version;
  }

  using http_request = basic_http_request<std::string>;
}
