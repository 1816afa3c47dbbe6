#include <grab/download/download-client.hxx>

#include <atomic>
#include <thread>
#include <utility>
#include <iostream>
#include <algorithm>
#include <exception>

#include <boost/asio/strand.hpp>
#include <boost/asio/co_spawn.hpp>

#include <grab/http/http-client.hxx>
#include <grab/download/download-state.hxx>

using namespace std;

namespace grab
{
  static string
  what (const exception_ptr& e)
  {
    try
    {
      rethrow_exception (e);
    }
    catch (const exception& x)
    {
      return x.what ();
    }
  }

  static asio::awaitable<void>
  run (shared_ptr<state_machine> m)
  {
    co_await m->run ();
  }

  client::
  client ()
      : client (make_shared<http_client> ())
  {
  }

  client::
  client (shared_ptr<http_transport> t, client_traits ct)
      : transport_ (move (t)), traits_ (move (ct))
  {
    pool_.emplace (max (thread::hardware_concurrency (), 2U));
    ex_ = pool_->get_executor ();
  }

  client::
  client (asio::any_io_executor ex,
          shared_ptr<http_transport> t,
          client_traits ct)
      : ex_ (move (ex)), transport_ (move (t)), traits_ (move (ct))
  {
  }

  client::
  ~client ()
  {
    if (pool_)
      pool_->join ();
  }

  shared_ptr<response> client::
  do_request (request q) const
  {
    cancel_scope s (q.scope ());
    shared_ptr<response> r (make_shared<response> (move (q), s));
    spawn (r);
    return r;
  }

  void client::
  spawn (shared_ptr<response> r) const
  {
    auto m (make_shared<state_machine> (r, transport_, traits_));

    asio::co_spawn (
      asio::make_strand (ex_),
      run (move (m)),
      [r] (exception_ptr e)
      {
        // The state machine reports failures through the response so this
        // is something out of the ordinary (out of memory, etc). Still
        // complete the response so that nobody waits forever.
        //
        if (e)
        {
          string m (what (e));
          cerr << "error: " << r->request ().url () << ": " << m << endl;

          r->complete (download_error (error::transport_failed,
                                       r->request ().url (),
                                       move (m)));
        }
      });
  }

  asio::awaitable<void> client::
  do_channel (cancel_scope s, request_channel& in, response_channel& out) const
  {
    for (;;)
    {
      optional<request> q (co_await in.async_receive (s));

      if (!q)
        break;

      cancel_scope rs (cancel_scope::linked (q->scope (), s));
      shared_ptr<response> r (make_shared<response> (move (*q), rs));

      state_machine m (r, transport_, traits_);
      co_await m.run ();

      out.send (move (r));
    }
  }

  shared_ptr<response_channel> client::
  do_batch (cancel_scope s, int workers, vector<request> qs) const
  {
    auto out (make_shared<response_channel> ());
    auto in (make_shared<request_channel> ());

    size_t n (workers < 1 ? qs.size () : static_cast<size_t> (workers));

    for (request& q: qs)
      in->send (move (q));

    in->close ();

    if (n == 0)
    {
      out->close ();
      return out;
    }

    // The last worker to finish closes the output channel.
    //
    auto left (make_shared<atomic<size_t>> (n));

    for (size_t i (0); i != n; ++i)
    {
      asio::co_spawn (
        asio::make_strand (ex_),
        do_channel (s, *in, *out),
        [in, out, left] (exception_ptr e)
        {
          if (e)
            cerr << "error: batch worker: " << what (e) << endl;

          if (left->fetch_sub (1, memory_order_acq_rel) == 1)
            out->close ();
        });
    }

    return out;
  }

  client&
  default_client ()
  {
    static client c;
    return c;
  }
}
