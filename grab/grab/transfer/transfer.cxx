#include <grab/transfer/transfer.hxx>

#include <boost/asio/error.hpp>

#include <grab/download/download-error.hxx>

using namespace std;

namespace grab
{
  using boost::system::error_code;

  transfer::
  transfer (cancel_scope s,
            shared_ptr<rate_limiter> l,
            writer& w,
            reader& r,
            size_t bs,
            atomic<uint64_t>& c)
      : scope_ (move (s)),
        limiter_ (move (l)),
        writer_ (w),
        reader_ (r),
        buffer_ (bs != 0 ? bs : default_buffer_size),
        counter_ (c)
  {
  }

  asio::awaitable<pair<uint64_t, error_code>> transfer::
  copy ()
  {
    uint64_t written (0);

    for (;;)
    {
      if (error_code e = scope_.error ())
        co_return make_pair (written, e);

      error_code ec;
      size_t nr (co_await reader_.read_some (asio::buffer (buffer_), ec));

      // Note that a reader may hand out data along with an error (typically
      // the final chunk with EOF) so we write whatever we've got first.
      //
      if (nr > 0)
      {
        error_code we;
        size_t nw (writer_.write (buffer_.data (), nr, we));

        if (nw > 0)
        {
          written += nw;
          counter_.fetch_add (nw, memory_order_relaxed);
        }

        if (we)
          co_return make_pair (written, we);

        if (nw != nr)
          co_return make_pair (written, error_code (error::short_write));

        // The bytes are already written at this point. If the limiter
        // fails (or gets canceled) we still stop right away.
        //
        if (limiter_ != nullptr)
        {
          if (error_code le = co_await limiter_->wait_n (scope_, nw))
            co_return make_pair (written, le);
        }
      }

      if (ec == asio::error::eof)
        break;

      if (ec)
        co_return make_pair (written, ec);
    }

    co_return make_pair (written, error_code ());
  }
}
