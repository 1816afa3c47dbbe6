#include <algorithm>

namespace grab
{
  // basic_http_headers
  //

  // Set a header, replacing any existing values.
  //
  // Note that unlike add() this enforces single value semantics which is what
  // we want for the request fields we control (Range, User-Agent, etc).
  //
  template <typename S>
  inline void basic_http_headers<S>::
  set (string_type n, string_type v)
  {
    remove (n);
    fields.push_back (field_type (std::move (n), std::move (v)));
  }

  template <typename S>
  inline void basic_http_headers<S>::
  add (string_type n, string_type v)
  {
    fields.push_back (field_type (std::move (n), std::move (v)));
  }

  template <typename S>
  inline std::optional<typename basic_http_headers<S>::string_type>
  basic_http_headers<S>::
  get (const string_type& n) const
  {
    auto i (std::find_if (fields.begin (), fields.end (),
                          [&n] (const field_type& f)
                          {
                            return iequals (f.name, n);
                          }));

    return i != fields.end () ? std::optional<string_type> (i->value)
                              : std::nullopt;
  }

  template <typename S>
  inline void basic_http_headers<S>::
  remove (const string_type& n)
  {
    fields.erase (std::remove_if (fields.begin (), fields.end (),
                                  [&n] (const field_type& f)
                                  {
                                    return iequals (f.name, n);
                                  }),
                  fields.end ());
  }
}
