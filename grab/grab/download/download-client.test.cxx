#include <grab/download/download-client.hxx>

#include <set>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <cassert>
#include <fstream>
#include <sstream>
#include <filesystem>

#include <boost/asio/strand.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include <grab/http/http-mock.hxx>
#include <grab/transfer/transfer-limiter.hxx>
#include <grab/download/download-error.hxx>

using namespace std;
using namespace grab;
namespace fs = std::filesystem;

static fs::path
temp_dir (const string& n)
{
  fs::path d (fs::temp_directory_path () / ("grab-client-" + n));
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

// Drain the channel until it is closed.
//
static vector<shared_ptr<response>>
drain (response_channel& c)
{
  vector<shared_ptr<response>> r;

  while (optional<shared_ptr<response>> x = c.receive ())
  {
    assert ((*x)->is_complete ());
    r.push_back (move (*x));
  }

  return r;
}

static void
test_do_request ()
{
  fs::path d (temp_dir ("request"));

  auto t (make_shared<mock_transport> ());
  t->on_get ("http://example.org/a.txt", reply (200, "alpha"));

  client_traits ct;
  ct.user_agent = "grab-test";

  client c (t, ct);
  assert (c.traits ().user_agent == "grab-test");

  shared_ptr<response> r (
    c.do_request (request (d, "http://example.org/a.txt")));
  assert (!r->wait ());
  assert (r->is_complete ());
  assert (r->filename () == d / "a.txt");
  assert (read_file (d / "a.txt") == "alpha");
  assert (r->end () >= r->start ());
  assert (r->eta () == r->end ());

  assert (*t->requests ().back ().get_header ("User-Agent") == "grab-test");

  fs::remove_all (d);
}

static void
test_cancel_in_flight ()
{
  fs::path d (temp_dir ("cancel"));
  const size_t n (1024 * 1024);

  mock_reply m (reply (200, string (n, 'x')));
  m.chunk = 8192;

  auto t (make_shared<mock_transport> ());
  t->on_get ("http://example.org/big.bin", m);

  client c (t);

  request q (d / "big.bin", "http://example.org/big.bin");
  q.limiter = make_shared<bandwidth_limiter> (64 * 1024);

  shared_ptr<response> r (c.do_request (move (q)));

  this_thread::sleep_for (chrono::milliseconds (300));
  assert (!r->is_complete ());
  assert (r->size () == n);

  r->cancel ();

  assert (r->err ());
  assert (r->err ()->code == error::canceled);
  assert (r->bytes_complete () < n);

  // What has been written stays written.
  //
  assert (fs::file_size (d / "big.bin") == r->bytes_complete ());

  fs::remove_all (d);
}

static void
test_do_channel ()
{
  fs::path d (temp_dir ("channel"));

  auto t (make_shared<mock_transport> ());
  t->on_get ("http://example.org/1", reply (200, "one"));
  t->on_get ("http://example.org/2", reply (200, "two"));
  t->on_get ("http://example.org/3", reply (500, "oops"));

  client c (t);

  request_channel in;
  response_channel out;

  in.send (request (d, "http://example.org/1"));
  in.send (request (d, "http://example.org/2"));
  in.send (request (d, "http://example.org/3"));
  in.close ();

  auto f (asio::co_spawn (asio::make_strand (c.executor ()),
                          c.do_channel (cancel_scope (), in, out),
                          asio::use_future));
  f.get ();

  // One at a time so the order is preserved. The output channel stays open.
  //
  assert (!out.closed ());

  auto r1 (out.try_receive ());
  auto r2 (out.try_receive ());
  auto r3 (out.try_receive ());
  assert (r1 && r2 && r3);
  assert (!out.try_receive ());

  assert (!(*r1)->err () && read_file (d / "1") == "one");
  assert (!(*r2)->err () && read_file (d / "2") == "two");
  assert ((*r3)->err () && (*r3)->err ()->code == error::bad_status);

  fs::remove_all (d);
}

static void
test_batch ()
{
  fs::path d (temp_dir ("batch"));

  auto t (make_shared<mock_transport> ());
  t->on_get ("http://example.org/ok.txt", reply (200, "success content"));
  t->on_get ("http://example.org/missing.txt", reply (404, "not found"));

  client c (t);

  vector<request> qs;
  qs.push_back (request (d, "http://example.org/ok.txt"));
  qs.push_back (request (d, "http://example.org/missing.txt"));

  auto ch (c.do_batch (cancel_scope (), 2, move (qs)));
  vector<shared_ptr<response>> rs (drain (*ch));

  assert (rs.size () == 2);
  assert (ch->closed ());

  for (const auto& r: rs)
  {
    if (r->request ().url () == "http://example.org/ok.txt")
    {
      assert (!r->err ());
      assert (read_file (d / "ok.txt") == "success content");
    }
    else
    {
      assert (r->err ());
      assert (r->status () == 404);
    }
  }

  fs::remove_all (d);
}

static void
test_batch_workers ()
{
  fs::path d (temp_dir ("workers"));

  auto t (make_shared<mock_transport> ());

  set<string> urls;
  vector<request> qs;

  for (size_t i (0); i != 10; ++i)
  {
    string u ("http://example.org/f" + std::to_string (i));
    t->on_get (u, reply (200, u));

    urls.insert (u);
    qs.push_back (request (d, u));
  }

  client c (t);

  // Bounded: every request yields exactly one response.
  //
  {
    auto rs (drain (*c.do_batch (cancel_scope (), 3, qs)));
    assert (rs.size () == 10);

    set<string> seen;
    for (const auto& r: rs)
    {
      assert (!r->err ());
      assert (seen.insert (r->request ().url ()).second);
    }
    assert (seen == urls);
  }

  // Unbounded: one worker per request.
  //
  {
    vector<request> one {request (d / "single", "http://example.org/f0")};

    auto rs (drain (*c.do_batch (cancel_scope (), 0, move (one))));
    assert (rs.size () == 1);
    assert (!rs[0]->err ());
  }

  // Nothing to do.
  //
  {
    auto ch (c.do_batch (cancel_scope (), 0, vector<request> ()));
    assert (ch->closed ());
    assert (!ch->receive ());
  }

  fs::remove_all (d);
}

static void
test_batch_canceled ()
{
  fs::path d (temp_dir ("batch-canceled"));

  auto t (make_shared<mock_transport> ());
  t->on_get ("http://example.org/a", reply (200, "a"));
  t->on_get ("http://example.org/b", reply (200, "b"));

  client c (t);

  cancel_scope s;
  s.cancel ();

  vector<request> qs;
  qs.push_back (request (d, "http://example.org/a"));
  qs.push_back (request (d, "http://example.org/b"));

  auto ch (c.do_batch (s, 0, move (qs)));

  // Nothing is picked up.
  //
  assert (drain (*ch).empty ());
  assert (ch->closed ());
  assert (t->requests ().empty ());

  fs::remove_all (d);
}

static void
test_batch_canceled_midway ()
{
  fs::path d (temp_dir ("batch-midway"));

  auto t (make_shared<mock_transport> ());

  cancel_scope s;
  vector<request> qs;

  for (size_t i (0); i != 5; ++i)
  {
    string u ("http://example.org/m" + std::to_string (i));
    t->on_get (u, reply (200, u));

    request q (d, u);

    // The first transfer cancels the whole batch once its data is in.
    //
    if (i == 0)
    {
      q.after_copy = [s] (response&) mutable
      {
        s.cancel ();
        return boost::system::error_code ();
      };
    }

    qs.push_back (move (q));
  }

  client c (t);

  // With a single worker the requests are picked up in order so the rest
  // must never start.
  //
  auto rs (drain (*c.do_batch (s, 1, move (qs))));

  assert (rs.size () == 1);
  assert (rs[0]->request ().url () == "http://example.org/m0");
  assert (rs[0]->err () && rs[0]->err ()->code == error::canceled);

  for (const http_request& r: t->requests ())
    assert (r.url == "http://example.org/m0");

  fs::remove_all (d);
}

static void
test_default ()
{
  client& c (default_client ());
  assert (&c == &default_client ());
  assert (c.traits ().user_agent == "grab");
}

int
main ()
{
  test_do_request ();
  test_cancel_in_flight ();
  test_do_channel ();
  test_batch ();
  test_batch_workers ();
  test_batch_canceled ();
  test_batch_canceled_midway ();
  test_default ();
}
