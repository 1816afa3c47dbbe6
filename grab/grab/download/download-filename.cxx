#include <grab/download/download-filename.hxx>

#include <map>
#include <ctime>
#include <chrono>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <locale>
#include <sstream>
#include <vector>
#include <stdexcept>

#include <grab/download/download-error.hxx>

using namespace std;

namespace grab
{
  // Content-Disposition parsing.
  //
  // disposition := type *( ";" parameter )
  // parameter   := name "=" ( token | quoted-string )
  //
  static inline bool
  token_char (char c)
  {
    unsigned char u (static_cast<unsigned char> (c));
    return u > 0x20 && u < 0x7f && strchr ("()<>@,;:\\\"/[]?=", c) == nullptr;
  }

  static inline void
  skip_space (const string& s, size_t& i)
  {
    while (i != s.size () && isspace (static_cast<unsigned char> (s[i])))
      ++i;
  }

  static string
  consume_token (const string& s, size_t& i)
  {
    size_t b (i);
    while (i != s.size () && token_char (s[i]))
      ++i;
    return s.substr (b, i - b);
  }

  static optional<string>
  consume_value (const string& s, size_t& i)
  {
    if (i != s.size () && s[i] == '"')
    {
      string r;

      for (++i; i != s.size (); )
      {
        char c (s[i++]);

        if (c == '"')
          return r;

        if (c == '\\' && i != s.size ())
          c = s[i++];

        r += c;
      }

      return nullopt; // Unterminated.
    }

    string t (consume_token (s, i));

    if (t.empty ())
      return nullopt;

    return t;
  }

  static string
  lower (string s)
  {
    for (char& c: s)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));
    return s;
  }

  // Decode an RFC 5987 ext-value (charset'language'pct-encoded). Only UTF-8
  // and US-ASCII are supported since we pass the bytes through as is.
  //
  static optional<string>
  decode_ext_value (const string& v)
  {
    size_t a (v.find ('\''));
    if (a == string::npos)
      return nullopt;

    size_t b (v.find ('\'', a + 1));
    if (b == string::npos)
      return nullopt;

    string cs (lower (v.substr (0, a)));

    if (cs != "utf-8" && cs != "us-ascii")
      return nullopt;

    try
    {
      return percent_decode (v.substr (b + 1));
    }
    catch (const invalid_argument&)
    {
      return nullopt;
    }
  }

  optional<string>
  disposition_filename (const string& s)
  {
    size_t i (0);
    skip_space (s, i);

    if (consume_token (s, i).empty ())
      return nullopt;

    map<string, string> ps;

    for (;;)
    {
      skip_space (s, i);

      if (i == s.size ())
        break;

      if (s[i] != ';')
        return nullopt;

      ++i;
      skip_space (s, i);

      // Ignore trailing semicolons.
      //
      if (i == s.size ())
        break;

      string n (lower (consume_token (s, i)));

      if (n.empty ())
        return nullopt;

      skip_space (s, i);

      if (i == s.size () || s[i] != '=')
        return nullopt;

      ++i;
      skip_space (s, i);

      optional<string> v (consume_value (s, i));

      if (!v || !ps.emplace (move (n), move (*v)).second)
        return nullopt;
    }

    if (auto p = ps.find ("filename*"); p != ps.end ())
    {
      if (auto v = decode_ext_value (p->second))
        return v;
    }

    if (auto p = ps.find ("filename"); p != ps.end ())
      return p->second;

    return nullopt;
  }

  filesystem::path
  guess_filename (const http_headers& h,
                  const string& url,
                  boost::system::error_code& ec)
  {
    ec = boost::system::error_code ();

    string n;

    // The URL has been validated by the time we get here but a redirect
    // target could still be something we cannot make sense of. In that case
    // we can only rely on the header.
    //
    try
    {
      n = parse_url (url).path ();
    }
    catch (const invalid_argument&)
    {
      n.clear ();
    }

    if (auto cd = h.get ("Content-Disposition"))
    {
      if (auto f = disposition_filename (*cd))
        n = move (*f);
    }

    if (n.empty () || n.back () == '/' || n.find ('\0') != string::npos)
    {
      ec = error::no_filename;
      return filesystem::path ();
    }

    // Clean the path as if it was rooted and take the last component. This
    // strips any directory and parent traversal components.
    //
    vector<string> cs;

    for (size_t b (0), e; b <= n.size (); b = e + 1)
    {
      e = n.find ('/', b);
      if (e == string::npos)
        e = n.size ();

      string c (n, b, e - b);

      if (c.empty () || c == ".")
        continue;

      if (c == "..")
      {
        if (!cs.empty ())
          cs.pop_back ();
      }
      else
        cs.push_back (move (c));
    }

    if (cs.empty ())
    {
      ec = error::no_filename;
      return filesystem::path ();
    }

    return filesystem::path (cs.back ());
  }

  optional<filesystem::file_time_type>
  parse_http_date (const string& s)
  {
    // IMF-fixdate first, then the obsolete RFC 850 and asctime forms.
    //
    static const char* const formats[] = {
      "%a, %d %b %Y %H:%M:%S GMT",
      "%A, %d-%b-%y %H:%M:%S GMT",
      "%a %b %e %H:%M:%S %Y"};

    tm t {};
    bool parsed (false);

    for (const char* f: formats)
    {
      t = tm {};

      istringstream is (s);
      is.imbue (locale::classic ());
      is >> get_time (&t, f);

      if (!is.fail ())
      {
        parsed = true;
        break;
      }
    }

    if (!parsed)
      return nullopt;

    time_t tt (timegm (&t));

    if (tt == static_cast<time_t> (-1))
      return nullopt;

    auto st (chrono::system_clock::from_time_t (tt));

    return chrono::time_point_cast<filesystem::file_time_type::duration> (
      chrono::file_clock::from_sys (st));
  }
}
