#include <grab/http/http-types.hxx>
#include <grab/http/http-request.hxx>
#include <grab/http/http-response.hxx>

#include <cassert>
#include <sstream>
#include <iostream>
#include <stdexcept>

using namespace std;
using namespace grab;

static void
test_method ()
{
  assert (to_string (http_method::get) == "GET");
  assert (to_string (http_method::head) == "HEAD");
  assert (to_http_method ("head") == http_method::head);

  bool t (false);
  try
  {
    to_http_method ("POST");
  }
  catch (const invalid_argument&)
  {
    t = true;
  }
  assert (t);
}

static void
test_status ()
{
  assert (to_string (http_status::partial_content) == "Partial Content");
  assert (to_string (static_cast<http_status> (299)) == "Unknown");

  assert (is_success (200) && is_success (206) && !is_success (304));
  assert (is_redirection (302) && !is_redirection (404));
}

static void
test_headers ()
{
  http_headers h;
  assert (h.empty ());

  h.add ("Set-Cookie", "a=1");
  h.add ("set-cookie", "b=2");
  assert (h.size () == 2);
  assert (*h.get ("SET-COOKIE") == "a=1");

  h.set ("Set-Cookie", "c=3");
  assert (h.size () == 1);
  assert (*h.get ("set-cookie") == "c=3");

  h.set ("Content-Length", "10");
  assert (h.contains ("content-length"));

  h.remove ("CONTENT-LENGTH");
  assert (!h.contains ("Content-Length"));
  assert (!h.get ("Content-Length"));
}

static void
test_request ()
{
  http_request r (http_method::get, "http://example.org/");
  r.set_user_agent ("grab");
  r.set_range (100);

  assert (*r.get_header ("user-agent") == "grab");
  assert (*r.get_header ("Range") == "bytes=100-");

  r.set_range (0);
  assert (r.headers.size () == 2);
  assert (*r.get_header ("Range") == "bytes=0-");

  ostringstream os;
  os << r;
  assert (os.str () == "GET http://example.org/ HTTP/1.1");
}

static void
test_response ()
{
  http_response r;
  r.status = 206;
  assert (r.is_success ());
  assert (!r.content_length ());
  assert (!r.content_range_start ());
  assert (r.accepts_ranges ());

  r.headers.set ("Content-Length", "150");
  r.headers.set ("Content-Range", "bytes 50-199/200");
  r.headers.set ("Accept-Ranges", "None");

  assert (*r.content_length () == 150);
  assert (*r.content_range_start () == 50);
  assert (!r.accepts_ranges ());

  // Garbage is treated as absent.
  //
  r.headers.set ("Content-Length", "15x");
  r.headers.set ("Content-Range", "items 0-1/2");
  assert (!r.content_length ());
  assert (!r.content_range_start ());

  r.headers.set ("Content-Length", "");
  assert (!r.content_length ());

  r.headers.set ("Content-Range", "bytes */200");
  assert (!r.content_range_start ());
}

static void
test_version ()
{
  http_version v;
  assert (v.packed () == 11);
  assert (v.string () == "HTTP/1.1");
  assert (http_version (1, 0) == http_version (1, 0));
}

int
main ()
{
  test_method ();
  test_status ();
  test_headers ();
  test_request ();
  test_response ();
  test_version ();
}
