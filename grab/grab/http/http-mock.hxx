#pragma once

#include <map>
#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <optional>

#include <boost/asio/awaitable.hpp>
#include <boost/system/system_error.hpp>

#include <grab/http/http-types.hxx>
#include <grab/http/http-request.hxx>
#include <grab/http/http-response.hxx>
#include <grab/http/http-transport.hxx>
#include <grab/transfer/transfer-io.hxx>
#include <grab/transfer/transfer-scope.hxx>

namespace grab
{
  // Canned reply.
  //
  struct mock_reply
  {
    std::uint16_t status = 200;
    http_headers headers;
    std::string body;

    // Effective URL to report (empty means the request URL).
    //
    std::string url;

    // Hand out the body in pieces of at most this many bytes (0 = at once).
    //
    std::size_t chunk = 0;

    // Answer "Range: bytes=N-" requests with 206 and the rest of the body.
    //
    bool ranges = false;
  };

  // In-process transport for tests.
  //
  // Replies are looked up by method and URL. A HEAD request without its own
  // reply gets the GET reply's status and headers. Anything else is a 404.
  // Content-Length is filled in unless the reply sets it. All the requests
  // are recorded.
  //
  class mock_transport: public http_transport
  {
  public:
    void
    on (http_method m, std::string url, mock_reply r)
    {
      std::lock_guard<std::mutex> l (mutex_);
      replies_[std::make_pair (m, std::move (url))] = std::move (r);
    }

    void
    on_get (std::string url, mock_reply r)
    {
      on (http_method::get, std::move (url), std::move (r));
    }

    std::vector<http_request>
    requests () const
    {
      std::lock_guard<std::mutex> l (mutex_);
      return requests_;
    }

    std::size_t
    count (http_method m) const
    {
      std::lock_guard<std::mutex> l (mutex_);

      std::size_t n (0);
      for (const http_request& r: requests_)
      {
        if (r.method == m)
          ++n;
      }
      return n;
    }

    asio::awaitable<http_stream>
    perform (http_request rq, cancel_scope s) override
    {
      if (boost::system::error_code e = s.error ())
        throw boost::system::system_error (e);

      mock_reply r (lookup (rq));

      http_stream rs;
      rs.status = r.status;
      rs.headers = r.headers;
      rs.url = r.url.empty () ? rq.url : r.url;

      std::string b (std::move (r.body));

      if (r.ranges && r.status == 200)
      {
        if (std::optional<std::uint64_t> o = range_offset (rq))
        {
          if (*o <= b.size ())
          {
            std::string t (std::to_string (b.size ()));
            std::string last (std::to_string (b.empty () ? 0 : b.size () - 1));

            rs.status = 206;
            rs.headers.set ("Content-Range",
                            "bytes " + std::to_string (*o) + '-' + last +
                            '/' + t);
            b.erase (0, *o);
          }
        }
      }

      if (!rs.headers.contains ("Content-Length"))
        rs.headers.set ("Content-Length", std::to_string (b.size ()));

      if (rq.method == http_method::head)
        b.clear ();

      rs.body = std::make_unique<memory_reader> (std::move (b), r.chunk);

      co_return rs;
    }

  private:
    mock_reply
    lookup (const http_request& rq)
    {
      std::lock_guard<std::mutex> l (mutex_);

      requests_.push_back (rq);

      auto i (replies_.find (std::make_pair (rq.method, rq.url)));

      if (i != replies_.end ())
        return i->second;

      if (rq.method == http_method::head)
      {
        i = replies_.find (std::make_pair (http_method::get, rq.url));

        if (i != replies_.end ())
          return i->second;
      }

      mock_reply r;
      r.status = 404;
      return r;
    }

    static std::optional<std::uint64_t>
    range_offset (const http_request& rq)
    {
      std::optional<std::string> v (rq.get_header ("Range"));

      if (!v || v->compare (0, 6, "bytes=") != 0 || v->back () != '-')
        return std::nullopt;

      return parse_uint64 (v->data () + 6, v->data () + v->size () - 1);
    }

  private:
    mutable std::mutex mutex_;
    std::map<std::pair<http_method, std::string>, mock_reply> replies_;
    std::vector<http_request> requests_;
  };
}
