#include <grab/download/download-request.hxx>

#include <cctype>
#include <utility>
#include <stdexcept>

using namespace std;

namespace grab
{
  request::
  request (filesystem::path d, const string& u)
      : url_ (u),
        parsed_url_ (parse_url (u)),
        destination_ (d.empty () ? filesystem::path (".") : move (d))
  {
  }

  request request::
  with_scope (cancel_scope s) const
  {
    request r (*this);
    r.scope_ = move (s);
    return r;
  }

  void request::
  set_checksum (hash_algorithm a, string expected, bool delete_on_error)
  {
    if (a == hash_algorithm::none)
    {
      checksum_ = nullopt;
      return;
    }

    if (expected.empty ())
      throw invalid_argument ("empty " + to_string (a) + " checksum");

    for (char c: expected)
    {
      if (!isxdigit (static_cast<unsigned char> (c)))
        throw invalid_argument ("invalid " + to_string (a) + " checksum '" +
                                expected + "'");
    }

    checksum_ = checksum_spec {a, move (expected), delete_on_error};
  }
}
