#include <grab/grab-download.hxx>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <iomanip>
#include <iostream>
#include <algorithm>
#include <stdexcept>
#include <filesystem>
#include <system_error>

#include <grab/http/http-client.hxx>
#include <grab/transfer/transfer-scope.hxx>
#include <grab/transfer/transfer-limiter.hxx>
#include <grab/download/download-types.hxx>
#include <grab/download/download-client.hxx>
#include <grab/download/download-request.hxx>
#include <grab/download/download-response.hxx>

using namespace std;
namespace fs = std::filesystem;

namespace grab
{
  // Print a single-line progress bar, overwriting the previous one.
  //
  static void
  print_progress (const response& r)
  {
    constexpr size_t width (40);

    uint64_t s (r.size ());
    uint64_t n (r.bytes_complete ());

    cout << '\r' << "Downloading: ";

    if (s != 0)
    {
      size_t f (static_cast<size_t> (width * min (r.progress (), 1.0)));

      cout << '[' << string (f, '=') << string (width - f, ' ') << "] "
           << fixed << setprecision (2) << setw (6) << r.progress () * 100
           << "% (" << n << '/' << s << " bytes)";
    }
    else
      cout << n << " bytes complete";

    cout << flush;
  }

  // Report the outcome of a completed download. Return true if it failed.
  //
  static bool
  report (const response& r, bool verbose)
  {
    const optional<download_error>& e (r.wait ());

    if (!verbose)
      return e.has_value ();

    if (e)
    {
      cerr << "error: " << r.request ().url () << ": " << e->message << endl;
      return true;
    }

    cout << "Downloaded: " << r.filename ().string ();

    std::error_code ec;
    uintmax_t n (fs::file_size (r.filename (), ec));

    if (!ec)
      cout << " (size: " << n << " bytes)";

    cout << endl;
    return false;
  }

  int
  download_command (const options& o, const vector<string>& urls)
  {
    if (urls.empty ())
    {
      cerr << "error: URL expected" << endl
           << "  info: run 'grab --help' for more information" << endl;
      return 1;
    }

    fs::path dir (o.output ());

    std::error_code ec;
    if (!fs::is_directory (dir, ec))
    {
      cerr << "error: " << dir.string () << " is not a directory" << endl;
      return 1;
    }

    client_traits ct;
    ct.user_agent = o.user_agent ();
    ct.verbosity = o.trace () ? 2 : o.verbose () ? 1 : 0;

    client c (make_shared<http_client> (), ct);

    // A single limiter throttles all the downloads together.
    //
    shared_ptr<rate_limiter> lim;
    if (o.limit_rate_specified ())
    {
      if (o.limit_rate () == 0)
        throw invalid_argument ("invalid --limit-rate value 0");

      lim = make_shared<bandwidth_limiter> (o.limit_rate ());
    }

    size_t failed (0);
    vector<request> qs;

    for (const string& u: urls)
    {
      try
      {
        request q (dir, u);
        q.no_resume = o.no_resume ();
        q.skip_existing = o.skip_existing ();
        q.limiter = lim;
        qs.push_back (move (q));
      }
      catch (const invalid_argument& e)
      {
        cerr << "error: invalid URL '" << u << "': " << e.what () << endl;
        ++failed;
      }
    }

    bool v (o.verbose ());

    if (o.jobs () == 1)
    {
      // One at a time with a progress bar in the verbose mode.
      //
      for (request& q: qs)
      {
        shared_ptr<response> r (c.do_request (move (q)));

        if (v)
        {
          while (!r->wait_for (chrono::milliseconds (100)))
            print_progress (*r);

          print_progress (*r);
          cout << endl;
        }

        if (report (*r, v))
          ++failed;
      }
    }
    else
    {
      int w (o.jobs () == 0
             ? 0
             : static_cast<int> (min<size_t> (o.jobs (), 1024)));

      shared_ptr<response_channel> rs (
        c.do_batch (cancel_scope (), w, move (qs)));

      while (optional<shared_ptr<response>> r = rs->receive ())
      {
        if (report (**r, v))
          ++failed;
      }
    }

    return static_cast<int> (min<size_t> (failed, 255));
  }
}
