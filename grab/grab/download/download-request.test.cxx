#include <grab/download/download-request.hxx>

#include <memory>
#include <string>
#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace std;
using namespace grab;
namespace fs = std::filesystem;

static void
test_construct ()
{
  request r ("out", "https://example.org/file.zip");
  assert (r.url () == "https://example.org/file.zip");
  assert (r.destination () == "out");
  assert (r.parsed_url ().host == "example.org");
  assert (!r.checksum ());
  assert (!r.size);
  assert (!r.skip_existing && !r.no_resume && !r.no_store);

  // Empty destination means the current directory.
  //
  request c ("", "http://example.org/x");
  assert (c.destination () == ".");

  bool t (false);
  try
  {
    request b (".", "http://bad host/");
  }
  catch (const invalid_argument&)
  {
    t = true;
  }
  assert (t);
}

static void
test_scope ()
{
  request r (".", "http://example.org/x");
  r.label = "label";
  r.no_resume = true;
  r.headers.set ("Accept", "*/*");
  r.limiter = make_shared<bandwidth_limiter> (100);

  cancel_scope s;
  request c (r.with_scope (s));

  assert (c.scope () == s);
  assert (!(r.scope () == s));

  // Everything else is copied.
  //
  assert (c.url () == r.url ());
  assert (c.label == "label");
  assert (c.no_resume);
  assert (*c.headers.get ("accept") == "*/*");
  assert (c.limiter == r.limiter);

  // Copies don't alias.
  //
  c.headers.set ("Accept", "text/plain");
  assert (*r.headers.get ("Accept") == "*/*");

  s.cancel ();
  assert (c.scope ().canceled ());
  assert (!r.scope ().canceled ());
}

static void
test_checksum ()
{
  request r (".", "http://example.org/x");

  r.set_checksum (hash_algorithm::sha256, "ABCdef0123", true);
  assert (r.checksum ());
  assert (r.checksum ()->algorithm == hash_algorithm::sha256);
  assert (r.checksum ()->expected == "ABCdef0123");
  assert (r.checksum ()->delete_on_error);

  r.set_checksum (hash_algorithm::none, "", false);
  assert (!r.checksum ());

  auto fails = [&r] (const string& e)
  {
    try
    {
      r.set_checksum (hash_algorithm::md5, e, false);
      return false;
    }
    catch (const invalid_argument&)
    {
      return true;
    }
  };

  assert (fails (""));
  assert (fails ("not-hex"));
  assert (!r.checksum ());
}

int
main ()
{
  test_construct ();
  test_scope ();
  test_checksum ();
}
