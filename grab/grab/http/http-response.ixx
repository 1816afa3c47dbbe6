#include <charconv>

namespace grab
{
  // Parse an unsigned decimal number spanning the whole [b, e) range.
  //
  inline std::optional<std::uint64_t>
  parse_uint64 (const char* b, const char* e)
  {
    std::uint64_t n (0);

    // Note that we use std::from_chars for locale-independent parsing.
    //
    auto r (std::from_chars (b, e, n));

    if (b == e || r.ec != std::errc () || r.ptr != e)
      return std::nullopt;

    return n;
  }

  template <typename S, typename B>
  inline std::optional<std::uint64_t> basic_http_response<S, B>::
  content_length () const
  {
    auto v (get_header (string_type ("Content-Length")));

    if (!v)
      return std::nullopt;

    return parse_uint64 (v->data (), v->data () + v->size ());
  }

  template <typename S, typename B>
  inline std::optional<std::uint64_t> basic_http_response<S, B>::
  content_range_start () const
  {
    auto v (get_header (string_type ("Content-Range")));

    if (!v)
      return std::nullopt;

    // bytes <first>-<last>/<complete-length>
    //
    const string_type& s (*v);
    string_type u ("bytes ");

    if (s.size () <= u.size () || !iequals (s.substr (0, u.size ()), u))
      return std::nullopt;

    std::size_t b (u.size ());
    std::size_t e (s.find ('-', b));

    if (e == string_type::npos)
      return std::nullopt;

    return parse_uint64 (s.data () + b, s.data () + e);
  }

  template <typename S, typename B>
  inline bool basic_http_response<S, B>::
  accepts_ranges () const
  {
    auto v (get_header (string_type ("Accept-Ranges")));
    return !v || !iequals (*v, string_type ("none"));
  }
}
