#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <utility>
#include <ostream>
#include <optional>

namespace grab
{
  // HTTP method.
  //
  // We only ever fetch things so there is no need to carry the whole verb
  // zoo around.
  //
  enum class http_method
  {
    get,
    head
  };

  std::string
  to_string (http_method);

  http_method
  to_http_method (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& o, http_method m)
  {
    return o << to_string (m);
  }

  // HTTP status code.
  //
  // Only the codes the transfer logic distinguishes are named. Anything else
  // is still representable (it is just a number) and is classified by its
  // class (2xx, 3xx, etc).
  //
  enum class http_status : std::uint16_t
  {
    ok                    = 200,
    no_content            = 204,
    partial_content       = 206,

    moved_permanently     = 301,
    found                 = 302,
    see_other             = 303,
    not_modified          = 304,
    temporary_redirect    = 307,
    permanent_redirect    = 308,

    bad_request           = 400,
    unauthorized          = 401,
    forbidden             = 403,
    not_found             = 404,
    method_not_allowed    = 405,
    gone                  = 410,
    range_not_satisfiable = 416,
    too_many_requests     = 429,

    internal_server_error = 500,
    bad_gateway           = 502,
    service_unavailable   = 503,
    gateway_timeout       = 504
  };

  // Return the reason phrase or "Unknown".
  //
  std::string
  to_string (http_status);

  inline std::ostream&
  operator<< (std::ostream& o, http_status s)
  {
    return o << static_cast<std::uint16_t> (s);
  }

  // Status class predicates.
  //
  inline bool
  is_success (std::uint16_t s) noexcept
  {
    return s >= 200 && s < 300;
  }

  inline bool
  is_redirection (std::uint16_t s) noexcept
  {
    return s >= 300 && s < 400;
  }

  // Case-insensitive ASCII comparison (header names, tokens, etc).
  //
  bool
  iequals (const std::string&, const std::string&) noexcept;

  // HTTP header field.
  //
  template <typename S>
  struct basic_http_field
  {
    using string_type = S;

    string_type name;
    string_type value;

    basic_http_field () = default;

    basic_http_field (string_type n, string_type v)
        : name (std::move (n)), value (std::move (v)) {}
  };

  template <typename S>
  inline bool
  operator== (const basic_http_field<S>& x, const basic_http_field<S>& y)
  {
    return x.name == y.name && x.value == y.value;
  }

  // HTTP headers collection.
  //
  // Field order is preserved and duplicates are allowed. Lookups are
  // case-insensitive as per RFC 7230.
  //
  template <typename S>
  struct basic_http_headers
  {
    using string_type = S;
    using field_type  = basic_http_field<string_type>;
    using fields_type = std::vector<field_type>;

    fields_type fields;

    basic_http_headers () = default;
    basic_http_headers (fields_type f) : fields (std::move (f)) {}

    // Set a header field, replacing any existing field with the same name.
    //
    void
    set (string_type name, string_type value);

    // Add a header field (allows duplicates).
    //
    void
    add (string_type name, string_type value);

    // Get the first value of a header field or nullopt if not present.
    //
    std::optional<string_type>
    get (const string_type& name) const;

    bool
    contains (const string_type& name) const
    {
      return get (name).has_value ();
    }

    // Remove all fields with the given name.
    //
    void
    remove (const string_type& name);

    bool
    empty () const noexcept
    {
      return fields.empty ();
    }

    std::size_t
    size () const noexcept
    {
      return fields.size ();
    }

    using iterator       = typename fields_type::iterator;
    using const_iterator = typename fields_type::const_iterator;

    iterator       begin ()       noexcept { return fields.begin (); }
    const_iterator begin () const noexcept { return fields.begin (); }
    iterator       end ()         noexcept { return fields.end (); }
    const_iterator end ()   const noexcept { return fields.end (); }
  };

  template <typename S>
  inline bool
  operator== (const basic_http_headers<S>& x, const basic_http_headers<S>& y)
  {
    return x.fields == y.fields;
  }

  using http_field   = basic_http_field<std::string>;
  using http_headers = basic_http_headers<std::string>;

  // HTTP version.
  //
  struct http_version
  {
    std::uint8_t major;
    std::uint8_t minor;

    http_version (std::uint8_t maj = 1, std::uint8_t min = 1)
        : major (maj), minor (min) {}

    // Beast-style packed representation (11 for HTTP/1.1).
    //
    unsigned
    packed () const noexcept
    {
      return major * 10u + minor;
    }

    bool
    operator== (const http_version& v) const noexcept
    {
      return major == v.major && minor == v.minor;
    }

    std::string
    string () const;
  };

  inline std::ostream&
  operator<< (std::ostream& o, const http_version& v)
  {
    return o << v.string ();
  }
}

#include <grab/http/http-types.ixx>
