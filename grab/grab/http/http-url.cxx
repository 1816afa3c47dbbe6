#include <grab/http/http-url.hxx>

#include <cctype>
#include <stdexcept>

using namespace std;

namespace grab
{
  static inline int
  hex_value (char c)
  {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  }

  string
  percent_decode (const string& s)
  {
    string r;
    r.reserve (s.size ());

    for (size_t i (0); i != s.size (); ++i)
    {
      char c (s[i]);

      if (c != '%')
      {
        r += c;
        continue;
      }

      int h (i + 2 < s.size () ? hex_value (s[i + 1]) : -1);
      int l (i + 2 < s.size () ? hex_value (s[i + 2]) : -1);

      if (h < 0 || l < 0)
        throw invalid_argument ("invalid URL escape '" + s.substr (i, 3) + "'");

      r += static_cast<char> (h * 16 + l);
      i += 2;
    }

    return r;
  }

  http_url
  parse_url (const string& url)
  {
    if (url.empty ())
      throw invalid_argument ("empty URL");

    // Whitespace and control characters are never valid in a URL (they must
    // be escaped). Catch them early since they would otherwise end up in the
    // request line.
    //
    for (char c: url)
    {
      unsigned char u (static_cast<unsigned char> (c));

      if (u <= 0x20 || u == 0x7f)
        throw invalid_argument ("invalid character in URL '" + url + "'");
    }

    http_url r;
    size_t pos (0);

    // Scheme.
    //
    // If there is no scheme we fall back to plain http, the same way a
    // browser would treat a bare host name.
    //
    size_t p (url.find ("://"));
    if (p != string::npos)
    {
      if (p == 0)
        throw invalid_argument ("missing protocol scheme in '" + url + "'");

      for (size_t i (0); i != p; ++i)
      {
        char c (url[i]);

        if (!(isalpha (static_cast<unsigned char> (c)) ||
              (i != 0 && (isdigit (static_cast<unsigned char> (c)) ||
                          c == '+' || c == '-' || c == '.'))))
          throw invalid_argument ("invalid protocol scheme in '" + url + "'");

        r.scheme += static_cast<char> (
          tolower (static_cast<unsigned char> (c)));
      }

      pos = p + 3;
    }
    else
      r.scheme = "http";

    // Authority (host[:port]).
    //
    size_t end (url.find_first_of ("/?#", pos));
    if (end == string::npos)
      end = url.size ();

    string auth (url.substr (pos, end - pos));

    // Strip user info, we don't do authentication.
    //
    if (size_t at = auth.rfind ('@'); at != string::npos)
      auth.erase (0, at + 1);

    size_t colon (auth.rfind (':'));
    if (colon != string::npos && auth.find (']', colon) == string::npos)
    {
      r.host = auth.substr (0, colon);
      r.port = auth.substr (colon + 1);

      for (char c: r.port)
      {
        if (!isdigit (static_cast<unsigned char> (c)))
          throw invalid_argument ("invalid port '" + r.port + "' in '" +
                                  url + "'");
      }
    }
    else
      r.host = auth;

    // IPv6 literal, strip the brackets for the resolver.
    //
    if (r.host.size () > 1 && r.host.front () == '[' && r.host.back () == ']')
      r.host = r.host.substr (1, r.host.size () - 2);

    if (r.host.empty ())
      throw invalid_argument ("missing host in '" + url + "'");

    if (r.port.empty ())
      r.port = r.secure () ? "443" : "80";

    // Target (path and query). The fragment is never sent to the server.
    //
    string t (url.substr (end));

    if (size_t h = t.find ('#'); h != string::npos)
      t.erase (h);

    if (t.empty () || t.front () != '/')
      t.insert (0, "/");

    r.target = move (t);

    // Make sure the path decodes.
    //
    r.path ();

    return r;
  }

  string http_url::
  path () const
  {
    return percent_decode (target.substr (0, target.find ('?')));
  }

  string http_url::
  string () const
  {
    std::string r (scheme + "://");

    if (host.find (':') != std::string::npos)
      r += '[' + host + ']';
    else
      r += host;

    if (!((scheme == "http" && port == "80") ||
          (scheme == "https" && port == "443")))
      r += ':' + port;

    r += target;
    return r;
  }

  std::string
  resolve_url (const http_url& base, const std::string& ref)
  {
    // Absolute URL.
    //
    if (ref.find ("://") != std::string::npos)
      return ref;

    http_url r (base);

    // Scheme-relative (//host/path).
    //
    if (ref.size () > 1 && ref[0] == '/' && ref[1] == '/')
      return base.scheme + ':' + ref;

    if (!ref.empty () && ref[0] == '/')
      r.target = ref;
    else
    {
      // Relative to the directory of the base path.
      //
      std::string d (base.target.substr (0, base.target.find ('?')));
      d.erase (d.rfind ('/') + 1);
      r.target = d + ref;
    }

    return r.string ();
  }
}
