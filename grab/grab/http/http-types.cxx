#include <grab/http/http-types.hxx>

#include <cctype>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace grab
{
  // http_method
  //
  string
  to_string (http_method m)
  {
    switch (m)
    {
      case http_method::get:  return "GET";
      case http_method::head: return "HEAD";
    }
    return "GET";
  }

  http_method
  to_http_method (const string& s)
  {
    if (iequals (s, "GET"))  return http_method::get;
    if (iequals (s, "HEAD")) return http_method::head;

    throw invalid_argument ("invalid HTTP method: " + s);
  }

  // http_status
  //
  string
  to_string (http_status s)
  {
    switch (s)
    {
      case http_status::ok:                    return "OK";
      case http_status::no_content:            return "No Content";
      case http_status::partial_content:       return "Partial Content";
      case http_status::moved_permanently:     return "Moved Permanently";
      case http_status::found:                 return "Found";
      case http_status::see_other:             return "See Other";
      case http_status::not_modified:          return "Not Modified";
      case http_status::temporary_redirect:    return "Temporary Redirect";
      case http_status::permanent_redirect:    return "Permanent Redirect";
      case http_status::bad_request:           return "Bad Request";
      case http_status::unauthorized:          return "Unauthorized";
      case http_status::forbidden:             return "Forbidden";
      case http_status::not_found:             return "Not Found";
      case http_status::method_not_allowed:    return "Method Not Allowed";
      case http_status::gone:                  return "Gone";
      case http_status::range_not_satisfiable: return "Range Not Satisfiable";
      case http_status::too_many_requests:     return "Too Many Requests";
      case http_status::internal_server_error: return "Internal Server Error";
      case http_status::bad_gateway:           return "Bad Gateway";
      case http_status::service_unavailable:   return "Service Unavailable";
      case http_status::gateway_timeout:       return "Gateway Timeout";
    }

    return "Unknown";
  }

  bool
  iequals (const string& x, const string& y) noexcept
  {
    if (x.size () != y.size ())
      return false;

    for (size_t i (0); i != x.size (); ++i)
    {
      if (tolower (static_cast<unsigned char> (x[i])) !=
          tolower (static_cast<unsigned char> (y[i])))
        return false;
    }

    return true;
  }

  // http_version
  //
  string http_version::
  string () const
  {
    ostringstream os;

    os << "HTTP/" << static_cast<unsigned> (major)
       << '.'     << static_cast<unsigned> (minor);

    return os.str ();
  }
}
