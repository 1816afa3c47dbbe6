#include <grab/download/download-batch.hxx>

#include <utility>
#include <iostream>
#include <stdexcept>
#include <exception>
#include <system_error>

#include <boost/asio/strand.hpp>
#include <boost/asio/co_spawn.hpp>

#include <grab/download/download-request.hxx>

using namespace std;
namespace fs = std::filesystem;

namespace grab
{
  shared_ptr<response>
  get (const client& c, fs::path d, const string& u)
  {
    shared_ptr<response> r (c.do_request (request (move (d), u)));
    r->wait ();
    return r;
  }

  shared_ptr<response>
  get (fs::path d, const string& u)
  {
    return get (default_client (), move (d), u);
  }

  shared_ptr<response_channel>
  get_batch (const client& c,
             const cancel_scope& s,
             int workers,
             const fs::path& d,
             const vector<string>& urls)
  {
    std::error_code ec;
    fs::file_status st (fs::status (d, ec));

    if (ec)
      throw system_error (ec, "unable to stat " + d.string ());

    if (!fs::is_directory (st))
      throw invalid_argument (d.string () + " is not a directory");

    vector<request> qs;
    qs.reserve (urls.size ());

    for (const string& u: urls)
      qs.push_back (request (d, u).with_scope (s));

    return c.do_batch (s, workers, move (qs));
  }

  // Drain the response channel into the projection channel and close it.
  // Note that we keep going even if the batch is canceled: the workers stop
  // on their own and close the input.
  //
  static asio::awaitable<void>
  forward (shared_ptr<response_channel> in, shared_ptr<download_channel> out)
  {
    cancel_scope s;

    while (optional<shared_ptr<response>> r = co_await in->async_receive (s))
      out->send (download_response {(*r)->filename (), (*r)->err ()});

    out->close ();
  }

  shared_ptr<download_channel>
  download_batch (const client& c,
                  const cancel_scope& s,
                  const vector<string>& urls)
  {
    shared_ptr<response_channel> rs (get_batch (c, s, 0, ".", urls));
    auto out (make_shared<download_channel> ());

    asio::co_spawn (
      asio::make_strand (c.executor ()),
      forward (move (rs), out),
      [out] (exception_ptr e)
      {
        if (e)
        {
          try
          {
            rethrow_exception (e);
          }
          catch (const exception& x)
          {
            cerr << "error: batch forwarder: " << x.what () << endl;
          }

          out->close ();
        }
      });

    return out;
  }

  shared_ptr<download_channel>
  download_batch (const cancel_scope& s, const vector<string>& urls)
  {
    return download_batch (default_client (), s, urls);
  }
}
