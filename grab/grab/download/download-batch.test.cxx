#include <grab/download/download-batch.hxx>

#include <memory>
#include <string>
#include <vector>
#include <cassert>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <filesystem>
#include <system_error>

#include <grab/http/http-mock.hxx>
#include <grab/download/download-error.hxx>

using namespace std;
using namespace grab;
namespace fs = std::filesystem;

static fs::path
temp_dir (const string& n)
{
  fs::path d (fs::temp_directory_path () / ("grab-batch-" + n));
  fs::remove_all (d);
  fs::create_directories (d);
  return d;
}

static string
read_file (const fs::path& p)
{
  ifstream i (p, ios::binary);
  ostringstream o;
  o << i.rdbuf ();
  return o.str ();
}

static mock_reply
reply (uint16_t s, string body)
{
  mock_reply r;
  r.status = s;
  r.body = move (body);
  return r;
}

static void
test_get ()
{
  fs::path d (temp_dir ("get"));

  auto t (make_shared<mock_transport> ());
  t->on_get ("http://example.org/x/readme.txt", reply (200, "hello"));
  t->on_get ("http://example.org/gone", reply (410, ""));

  client c (t);

  shared_ptr<response> r (get (c, d, "http://example.org/x/readme.txt"));
  assert (r->is_complete ());
  assert (!r->err ());
  assert (r->filename () == d / "readme.txt");
  assert (r->bytes () == "hello");

  r = get (c, d / "gone.txt", "http://example.org/gone");
  assert (r->is_complete ());
  assert (r->err () && r->err ()->code == error::bad_status);

  bool thrown (false);
  try
  {
    get (c, d, "not a url");
  }
  catch (const invalid_argument&)
  {
    thrown = true;
  }
  assert (thrown);

  fs::remove_all (d);
}

static void
test_get_batch ()
{
  fs::path d (temp_dir ("get-batch"));

  auto t (make_shared<mock_transport> ());
  t->on_get ("http://example.org/a.txt", reply (200, "a"));
  t->on_get ("http://example.org/b.txt", reply (200, "bb"));

  client c (t);
  vector<string> urls {"http://example.org/a.txt", "http://example.org/b.txt"};

  {
    auto ch (get_batch (c, cancel_scope (), 1, d, urls));

    size_t n (0);
    while (optional<shared_ptr<response>> r = ch->receive ())
    {
      assert (!(*r)->err ());
      ++n;
    }

    assert (n == 2);
    assert (read_file (d / "a.txt") == "a");
    assert (read_file (d / "b.txt") == "bb");
  }

  // Missing directory.
  //
  {
    bool thrown (false);
    try
    {
      get_batch (c, cancel_scope (), 1, d / "missing", urls);
    }
    catch (const system_error&)
    {
      thrown = true;
    }
    assert (thrown);
  }

  // Not a directory.
  //
  {
    bool thrown (false);
    try
    {
      get_batch (c, cancel_scope (), 1, d / "a.txt", urls);
    }
    catch (const invalid_argument&)
    {
      thrown = true;
    }
    assert (thrown);
  }

  // Invalid URL: nothing is started.
  //
  {
    size_t n (t->requests ().size ());

    bool thrown (false);
    try
    {
      get_batch (c, cancel_scope (), 1, d, {"http://example.org/a.txt", ""});
    }
    catch (const invalid_argument&)
    {
      thrown = true;
    }
    assert (thrown);
    assert (t->requests ().size () == n);
  }

  fs::remove_all (d);
}

static void
test_download_batch ()
{
  fs::path d (temp_dir ("download"));
  fs::path cwd (fs::current_path ());
  fs::current_path (d);

  auto t (make_shared<mock_transport> ());
  t->on_get ("http://example.org/ok.txt", reply (200, "success content"));
  t->on_get ("http://example.org/missing.txt", reply (404, "not found"));

  {
    client c (t);

    auto ch (download_batch (c,
                             cancel_scope (),
                             {"http://example.org/ok.txt",
                              "http://example.org/missing.txt"}));

    vector<download_response> rs;
    while (optional<download_response> r = ch->receive ())
      rs.push_back (move (*r));

    assert (ch->closed ());
    assert (rs.size () == 2);

    // The failed transfer never got far enough to name its file.
    //
    size_t failed (0);
    for (const download_response& r: rs)
    {
      if (r.error)
      {
        assert (r.error->code == error::bad_status);
        ++failed;
      }
      else
        assert (r.filename.filename () == "ok.txt");
    }

    assert (failed == 1);
    assert (read_file ("ok.txt") == "success content");
  }

  fs::current_path (cwd);
  fs::remove_all (d);
}

int
main ()
{
  test_get ();
  test_get_batch ();
  test_download_batch ();
}
