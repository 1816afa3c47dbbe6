#include <grab/download/download-response.hxx>

#include <fstream>
#include <sstream>
#include <utility>

#include <boost/system/system_error.hpp>

using namespace std;

namespace grab
{
  response::
  response (grab::request r, const cancel_scope& s)
      : request_ (move (r)),
        scope_ (cancel_scope::with_cancel (s)),
        start_ (clock::now ()),
        done_ (promise_.get_future ().share ())
  {
  }

  const optional<download_error>& response::
  wait () const
  {
    done_.wait ();
    return error_;
  }

  optional<download_error> response::
  err () const
  {
    return is_complete () ? error_ : nullopt;
  }

  void response::
  cancel ()
  {
    scope_.cancel ();
    wait ();
  }

  double response::
  progress () const noexcept
  {
    uint64_t s (size ());
    return s != 0 ? static_cast<double> (bytes_complete ()) / s : 0.0;
  }

  response::clock::duration response::
  duration () const noexcept
  {
    return (is_complete () ? end_ : clock::now ()) - start_;
  }

  double response::
  bytes_per_second () const noexcept
  {
    double s (chrono::duration<double> (duration ()).count ());

    return s > 0
      ? static_cast<double> (transferred_.load (memory_order_relaxed)) / s
      : 0.0;
  }

  response::clock::time_point response::
  eta () const noexcept
  {
    if (is_complete ())
      return end_;

    uint64_t s (size ());
    uint64_t n (bytes_complete ());
    double bps (bytes_per_second ());

    if (s == 0 || bps <= 0 || n >= s)
      return clock::now ();

    chrono::duration<double> left ((s - n) / bps);
    return clock::now () + chrono::duration_cast<clock::duration> (left);
  }

  string response::
  bytes () const
  {
    if (const auto& e = wait ())
      throw boost::system::system_error (e->code, e->message);

    if (request_.no_store)
      return content_;

    ifstream ifs (filename_, ios::binary);
    if (!ifs)
      throw boost::system::system_error (
        boost::system::errc::make_error_code (
          boost::system::errc::no_such_file_or_directory),
        "unable to open " + filename_.string ());

    ostringstream os;
    os << ifs.rdbuf ();
    return os.str ();
  }

  void response::
  complete (optional<download_error> e)
  {
    // Note that the error must be assigned before the gate is closed: the
    // waiters read it without any other synchronization.
    //
    if (closed_.exchange (true, memory_order_acq_rel))
      return;

    error_ = move (e);
    end_ = clock::now ();

    complete_.store (true, memory_order_release);
    promise_.set_value ();
  }
}
