#include <grab/download/download-state.hxx>

#include <utility>
#include <iostream>
#include <exception>
#include <stdexcept>
#include <system_error>

#include <boost/system/system_error.hpp>

#include <grab/transfer/transfer.hxx>
#include <grab/checksum/checksum-digest.hxx>
#include <grab/download/download-filename.hxx>

using namespace std;
namespace fs = std::filesystem;

namespace grab
{
  using boost::system::error_code;

  state_machine::
  state_machine (shared_ptr<response> r,
                 shared_ptr<http_transport> t,
                 const client_traits& ct)
      : r_ (move (r)),
        transport_ (move (t)),
        traits_ (ct),
        url_ (r_->request_.url ())
  {
  }

  asio::awaitable<void> state_machine::
  run ()
  {
    download_state s (download_state::resolve_destination);

    while (s != download_state::finalize)
    {
      if (error_code e = r_->scope_.error ())
      {
        s = fail (e);
        break;
      }

      if (tracing ())
        cerr << "trace: " << r_->request_.url () << ": " << s << endl;

      // Any exception escaping a step is the transfer's terminal error.
      // Exceptions that don't carry an error code are attributed to the
      // server exchange if that's what we were doing.
      //
      download_state c (s);

      try
      {
        switch (s)
        {
        case download_state::resolve_destination:
          s = co_await resolve_destination ();
          break;
        case download_state::probe_remote:
          s = co_await probe_remote ();
          break;
        case download_state::issue_transfer:
          s = co_await issue_transfer ();
          break;
        case download_state::open_writer:
          s = open_writer ();
          break;
        case download_state::stream:
          s = co_await stream ();
          break;
        case download_state::verify_checksum:
          s = verify_checksum ();
          break;
        case download_state::finalize:
          break;
        }
      }
      catch (const boost::system::system_error& e)
      {
        s = fail (e.code (), e.what ());
      }
      catch (const system_error& e)
      {
        s = fail (to_error_code (e.code ()), e.what ());
      }
      catch (const exception& e)
      {
        bool remote (c == download_state::probe_remote ||
                     c == download_state::issue_transfer);

        s = fail (remote
                  ? make_error_code (error::transport_failed)
                  : boost::system::errc::make_error_code (
                      boost::system::errc::io_error),
                  e.what ());
      }
    }

    finalize ();
  }

  // Inspect the local destination and decide whether we can skip the
  // transfer, resume it, or have to start over.
  //
  asio::awaitable<download_state> state_machine::
  resolve_destination ()
  {
    const request& q (r_->request_);

    if (q.no_store)
      co_return download_state::probe_remote;

    if (r_->filename_.empty ())
    {
      const fs::path& d (q.destination ());

      // A directory (existing or spelled with a trailing separator) means
      // the name has to come from the server.
      //
      std::error_code ec;
      if (!d.has_filename () || fs::is_directory (d, ec))
        co_return download_state::probe_remote;

      r_->filename_ = d;
    }

    std::error_code ec;
    fs::file_status st (fs::status (r_->filename_, ec));

    if (st.type () == fs::file_type::not_found)
    {
      exists_ = false;
      co_return download_state::probe_remote;
    }

    if (ec)
      co_return fail (to_error_code (ec),
                      "unable to stat " + r_->filename_.string () + ": " +
                      ec.message ());

    if (fs::is_directory (st))
      co_return fail (boost::system::errc::make_error_code (
                        boost::system::errc::is_a_directory),
                      "destination " + r_->filename_.string () +
                      " is a directory");

    exists_ = true;

    if (q.skip_existing)
    {
      if (tracing ())
        cerr << "trace: " << r_->filename_ << " exists, skipping" << endl;

      co_return download_state::finalize;
    }

    if (q.no_resume)
      co_return download_state::issue_transfer;

    uint64_t n (fs::file_size (r_->filename_));

    optional<uint64_t> size (q.size ? q.size : expected_);

    // Ask the server before deciding anything.
    //
    if (!size && !probed_)
      co_return download_state::probe_remote;

    if (size)
    {
      r_->size_.store (*size, memory_order_relaxed);

      if (*size == n)
      {
        r_->did_resume_ = n != 0;
        r_->bytes_resumed_.store (n, memory_order_relaxed);
        co_return download_state::verify_checksum;
      }

      if (*size < n)
        co_return fail (error::bad_length,
                        "local file " + r_->filename_.string () + " (" +
                        std::to_string (n) + " bytes) is larger than remote (" +
                        std::to_string (*size) + " bytes)");
    }

    if (n != 0 && ranges_)
    {
      r_->did_resume_ = true;
      r_->bytes_resumed_.store (n, memory_order_relaxed);
    }

    co_return download_state::issue_transfer;
  }

  // Send a HEAD request to learn the size, the file name, and whether the
  // server supports ranges.
  //
  asio::awaitable<download_state> state_machine::
  probe_remote ()
  {
    const request& q (r_->request_);

    if (probed_)
      co_return download_state::issue_transfer;

    probed_ = true;

    // Nothing to learn: we are going to (re)write the file from scratch.
    //
    if (q.no_resume || (!r_->filename_.empty () && !exists_))
      co_return download_state::issue_transfer;

    http_stream rs (
      co_await transport_->perform (make_request (http_method::head),
                                    r_->scope_));
    record (rs);

    if (rs.body && *rs.body)
      (*rs.body)->close ();

    if (tracing ())
      cerr << "trace: HEAD " << url_ << ": " << rs << endl;

    if (rs.status != 200)
      co_return download_state::issue_transfer;

    // Send the actual request to wherever we were redirected: that's the
    // server that told us about range support.
    //
    if (!rs.url.empty ())
      url_ = rs.url;

    expected_ = rs.content_length ();
    ranges_ = rs.accepts_ranges ();

    if (expected_)
      r_->size_.store (*expected_, memory_order_relaxed);

    if (r_->filename_.empty ())
    {
      error_code ec;
      fs::path n (guess_filename (rs.headers, url_, ec));

      if (ec)
      {
        if (!q.no_store)
          co_return fail (ec);
      }
      else
        r_->filename_ = q.destination () / n;
    }

    co_return q.no_store
      ? download_state::issue_transfer
      : download_state::resolve_destination;
  }

  asio::awaitable<download_state> state_machine::
  issue_transfer ()
  {
    const request& q (r_->request_);

    http_request rq (make_request (http_method::get));

    if (r_->did_resume_)
      rq.set_range (r_->bytes_resumed_.load (memory_order_relaxed));

    http_stream rs (co_await transport_->perform (move (rq), r_->scope_));
    record (rs);

    if (rs.body)
      body_ = move (*rs.body);

    if (tracing ())
      cerr << "trace: GET " << url_ << ": " << rs << endl;

    if (!rs.is_success () && !q.ignore_bad_status_codes)
      co_return fail (error::bad_status,
                      "server returned " + std::to_string (rs.status) +
                      (rs.reason.empty () ? "" : " " + rs.reason));

    if (r_->did_resume_)
    {
      uint64_t o (r_->bytes_resumed_.load (memory_order_relaxed));

      if (rs.status == 206)
      {
        optional<uint64_t> s (rs.content_range_start ());

        if (s && *s != o)
          co_return fail (error::resume_mismatch,
                          "server resumed at offset " + std::to_string (*s) +
                          " instead of " + std::to_string (o));
      }
      else
      {
        // The server ignored the range and is sending everything.
        //
        if (tracing ())
          cerr << "trace: range ignored, restarting "
               << r_->request_.url () << endl;

        r_->did_resume_ = false;
        r_->bytes_resumed_.store (0, memory_order_relaxed);
      }
    }

    if (optional<uint64_t> l = rs.content_length ())
    {
      uint64_t s (*l + r_->bytes_resumed_.load (memory_order_relaxed));

      if (q.size && *q.size != s)
        co_return fail (error::bad_length,
                        "expected " + std::to_string (*q.size) +
                        " bytes, server reports " + std::to_string (s));

      expected_ = s;
    }
    else
      expected_ = q.size;

    r_->size_.store (expected_ ? *expected_ : 0, memory_order_relaxed);

    if (r_->filename_.empty ())
    {
      error_code ec;
      fs::path n (guess_filename (rs.headers,
                                  rs.url.empty () ? url_ : rs.url,
                                  ec));
      if (ec)
      {
        if (!q.no_store)
          co_return fail (ec);
      }
      else
        r_->filename_ = q.destination () / n;
    }

    co_return download_state::open_writer;
  }

  download_state state_machine::
  open_writer ()
  {
    const request& q (r_->request_);

    if (q.no_store)
    {
      writer_ = make_unique<memory_writer> ();
      return download_state::stream;
    }

    if (!q.no_create_directories)
    {
      fs::path d (r_->filename_.parent_path ());

      if (!d.empty ())
      {
        std::error_code ec;
        fs::create_directories (d, ec);

        if (ec)
          return fail (to_error_code (ec),
                       "unable to create directory " + d.string () + ": " +
                       ec.message ());
      }
    }

    writer_ = make_unique<file_writer> (r_->filename_, r_->did_resume_);
    return download_state::stream;
  }

  asio::awaitable<download_state> state_machine::
  stream ()
  {
    const request& q (r_->request_);

    if (q.before_copy)
    {
      if (error_code e = q.before_copy (*r_))
        co_return fail (e);
    }

    // A response without a body (HEAD answered in place of GET by a
    // misbehaving transport) copies nothing.
    //
    uint64_t n (0);
    error_code ec;

    if (body_ != nullptr)
    {
      transfer t (r_->scope_,
                  q.limiter,
                  *writer_,
                  *body_,
                  q.buffer_size != 0 ? q.buffer_size : traits_.buffer_size,
                  r_->transferred_);

      tie (n, ec) = co_await t.copy ();
    }

    error_code cec;
    writer_->close (cec);

    if (ec)
      co_return fail (ec);

    if (cec)
      co_return fail (cec, "unable to close " + r_->filename_.string () +
                      ": " + cec.message ());

    uint64_t total (r_->bytes_resumed_.load (memory_order_relaxed) + n);

    if (expected_ && *expected_ != total)
      co_return fail (error::bad_length,
                      "received " + std::to_string (total) +
                      " bytes instead of " + std::to_string (*expected_));

    if (!expected_)
      r_->size_.store (total, memory_order_relaxed);

    if (q.after_copy)
    {
      if (error_code e = q.after_copy (*r_))
        co_return fail (e);
    }

    co_return download_state::verify_checksum;
  }

  download_state state_machine::
  verify_checksum ()
  {
    const request& q (r_->request_);
    const optional<checksum_spec>& c (q.checksum ());

    if (!c)
      return download_state::finalize;

    string h;

    if (q.no_store)
    {
      digest d (c->algorithm);

      if (auto* w = dynamic_cast<memory_writer*> (writer_.get ()))
        d.update (w->data ());

      h = d.hex ();
    }
    else
      h = file_digest (c->algorithm, r_->filename_);

    if (digest_equal (h, c->expected))
      return download_state::finalize;

    string m ("checksum mismatch: expected " + c->expected + ", got " + h);

    if (c->delete_on_error && !q.no_store)
    {
      std::error_code ec;
      if (!fs::remove (r_->filename_, ec) && ec)
        m += " (unable to remove " + r_->filename_.string () + ": " +
             ec.message () + ")";
    }

    return fail (error::bad_checksum, move (m));
  }

  void state_machine::
  finalize () noexcept
  {
    const request& q (r_->request_);

    // Setting the modification time is best-effort.
    //
    if (!error_ && !q.no_store && !q.ignore_remote_time &&
        !r_->filename_.empty ())
    {
      if (optional<string> lm = r_->headers_.get ("Last-Modified"))
      {
        if (optional<fs::file_time_type> t = parse_http_date (*lm))
        {
          std::error_code ec;
          fs::last_write_time (r_->filename_, *t, ec);

          if (ec && tracing ())
            cerr << "trace: unable to set modification time of "
                 << r_->filename_ << ": " << ec.message () << endl;
        }
      }
    }

    if (writer_ != nullptr)
    {
      error_code ec;
      writer_->close (ec); // Already closed unless we failed mid-way.

      if (auto* w = dynamic_cast<memory_writer*> (writer_.get ()))
        r_->content_ = w->release ();

      writer_.reset ();
    }

    if (body_ != nullptr)
    {
      body_->close ();
      body_.reset ();
    }

    if (tracing ())
      cerr << "trace: " << r_->request_.url () << ": done"
           << (error_ ? " (" + error_->message + ")" : string ()) << endl;

    r_->complete (move (error_));
  }

  download_state state_machine::
  fail (error_code e, string m)
  {
    if (!error_)
      error_ = download_error (e, r_->request_.url (), move (m));

    return download_state::finalize;
  }

  http_request state_machine::
  make_request (http_method m) const
  {
    http_request r (m, url_, r_->request_.headers);

    if (!r.headers.contains ("User-Agent"))
      r.set_user_agent (traits_.user_agent);

    return r;
  }

  void state_machine::
  record (const http_stream& s)
  {
    r_->status_ = s.status;
    r_->headers_ = s.headers;
  }
}
