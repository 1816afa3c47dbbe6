#include <grab/transfer/transfer.hxx>

#include <atomic>
#include <memory>
#include <string>
#include <cassert>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include <grab/transfer/transfer-io.hxx>
#include <grab/transfer/transfer-limiter.hxx>
#include <grab/transfer/transfer-scope.hxx>
#include <grab/download/download-error.hxx>

using namespace std;
using namespace grab;

using boost::system::error_code;

static pair<uint64_t, boost::system::error_code>
run (transfer& t)
{
  asio::io_context ioc;
  auto f (asio::co_spawn (ioc, t.copy (), asio::use_future));
  ioc.run ();
  return f.get ();
}

// Writer that accepts at most n bytes per call.
//
class short_writer: public writer
{
public:
  explicit
  short_writer (size_t n): n_ (n) {}

  size_t
  write (const char*, size_t n, boost::system::error_code&) override
  {
    return min (n, n_);
  }

private:
  size_t n_;
};

// Writer that fails after the specified number of bytes.
//
class failing_writer: public writer
{
public:
  explicit
  failing_writer (size_t n): left_ (n) {}

  size_t
  write (const char*, size_t n, boost::system::error_code& ec) override
  {
    if (n > left_)
    {
      ec = boost::system::errc::make_error_code (
        boost::system::errc::no_space_on_device);
      return 0;
    }

    left_ -= n;
    return n;
  }

private:
  size_t left_;
};

// Reader that cancels the scope once it has handed out the first chunk.
//
class canceling_reader: public memory_reader
{
public:
  canceling_reader (string d, size_t chunk, cancel_scope s)
      : memory_reader (move (d), chunk), scope_ (move (s)) {}

  asio::awaitable<size_t>
  read_some (asio::mutable_buffer b, boost::system::error_code& ec) override
  {
    size_t n (co_await memory_reader::read_some (b, ec));
    scope_.cancel ();
    co_return n;
  }

private:
  cancel_scope scope_;
};

// Reader that fails with a connection reset once it has handed out the
// first chunk.
//
class failing_reader: public memory_reader
{
public:
  failing_reader (string d, size_t chunk)
      : memory_reader (move (d), chunk) {}

  asio::awaitable<size_t>
  read_some (asio::mutable_buffer b, boost::system::error_code& ec) override
  {
    if (reads_++ != 0)
    {
      ec = boost::system::errc::make_error_code (
        boost::system::errc::connection_reset);
      co_return 0;
    }

    co_return co_await memory_reader::read_some (b, ec);
  }

private:
  size_t reads_ = 0;
};

// Limiter that lets everything through and keeps count.
//
class counting_limiter: public rate_limiter
{
public:
  asio::awaitable<boost::system::error_code>
  wait_n (const cancel_scope&, size_t n) override
  {
    ++calls;
    bytes += n;
    co_return boost::system::error_code ();
  }

  size_t calls = 0;
  size_t bytes = 0;
};

// Limiter that refuses to go on.
//
class failing_limiter: public rate_limiter
{
public:
  asio::awaitable<boost::system::error_code>
  wait_n (const cancel_scope&, size_t) override
  {
    ++calls;
    co_return boost::system::errc::make_error_code (
      boost::system::errc::operation_not_permitted);
  }

  size_t calls = 0;
};

static void
test_copy ()
{
  string d (100000, 'x');
  d[0] = 'a';
  d[d.size () - 1] = 'z';

  memory_reader r (d, 1000);
  memory_writer w;
  atomic<uint64_t> c (0);

  transfer t (cancel_scope (), nullptr, w, r, 4096, c);
  auto [n, ec] = run (t);

  assert (!ec);
  assert (n == d.size ());
  assert (c == d.size ());
  assert (t.n () == d.size ());
  assert (w.data () == d);
}

static void
test_empty ()
{
  memory_reader r ("");
  memory_writer w;
  atomic<uint64_t> c (0);

  transfer t (cancel_scope (), nullptr, w, r, 0, c);
  auto [n, ec] = run (t);

  assert (!ec && n == 0 && w.data ().empty ());
}

static void
test_counter ()
{
  // The counter accumulates (a resumed transfer continues counting).
  //
  memory_reader r ("hello");
  memory_writer w;
  atomic<uint64_t> c (10);

  transfer t (cancel_scope (), nullptr, w, r, 0, c);
  auto [n, ec] = run (t);

  assert (!ec && n == 5 && c == 15);
}

static void
test_cancel ()
{
  // Canceled before the first read: nothing is written.
  //
  {
    cancel_scope s;
    s.cancel ();

    memory_reader r ("data");
    memory_writer w;
    atomic<uint64_t> c (0);

    transfer t (s, nullptr, w, r, 0, c);
    auto [n, ec] = run (t);

    assert (ec == error::canceled);
    assert (n == 0 && w.data ().empty ());
  }

  // Canceled mid-way: what has been written stays written.
  //
  {
    cancel_scope s;

    canceling_reader r (string (100, 'x'), 10, s);
    memory_writer w;
    atomic<uint64_t> c (0);

    transfer t (s, nullptr, w, r, 0, c);
    auto [n, ec] = run (t);

    assert (ec == error::canceled);
    assert (n == 10 && w.data () == string (10, 'x'));
  }
}

static void
test_write_errors ()
{
  {
    memory_reader r (string (100, 'x'), 10);
    short_writer w (5);
    atomic<uint64_t> c (0);

    transfer t (cancel_scope (), nullptr, w, r, 0, c);
    auto [n, ec] = run (t);

    assert (ec == error::short_write);
    assert (n == 5 && c == 5);
  }

  {
    memory_reader r (string (100, 'x'), 10);
    failing_writer w (30);
    atomic<uint64_t> c (0);

    transfer t (cancel_scope (), nullptr, w, r, 0, c);
    auto [n, ec] = run (t);

    assert (ec == boost::system::errc::no_space_on_device);
    assert (n == 30);
  }
}

static void
test_limiter ()
{
  // Every written chunk is accounted for.
  //
  {
    auto l (make_shared<counting_limiter> ());

    memory_reader r (string (100, 'x'), 10);
    memory_writer w;
    atomic<uint64_t> c (0);

    transfer t (cancel_scope (), l, w, r, 0, c);
    auto [n, ec] = run (t);

    assert (!ec && n == 100);
    assert (l->calls == 10 && l->bytes == 100);
  }

  // A limiter error is terminal but the chunk is already written.
  //
  {
    auto l (make_shared<failing_limiter> ());

    memory_reader r (string (100, 'x'), 10);
    memory_writer w;
    atomic<uint64_t> c (0);

    transfer t (cancel_scope (), l, w, r, 0, c);
    auto [n, ec] = run (t);

    assert (ec == boost::system::errc::operation_not_permitted);
    assert (l->calls == 1);
    assert (n == 10 && c == 10 && w.data () == string (10, 'x'));
  }
}

static void
test_read_error ()
{
  failing_reader r (string (100, 'x'), 10);
  memory_writer w;
  atomic<uint64_t> c (0);

  transfer t (cancel_scope (), nullptr, w, r, 0, c);
  auto [n, ec] = run (t);

  assert (ec == boost::system::errc::connection_reset);
  assert (n == 10 && w.data () == string (10, 'x'));
}

int
main ()
{
  test_copy ();
  test_empty ();
  test_counter ();
  test_cancel ();
  test_write_errors ();
  test_limiter ();
  test_read_error ();
}
