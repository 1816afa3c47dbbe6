#include <grab/transfer/transfer-io.hxx>

#include <cerrno>
#include <cstring>
#include <algorithm>

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

using namespace std;

namespace grab
{
  using boost::system::error_code;

  // Return the errno-based error if there is one and fallback to a generic
  // I/O error otherwise (iostreams don't guarantee errno is set).
  //
  static inline error_code
  last_io_error ()
  {
    int e (errno);
    return e != 0
      ? error_code (e, boost::system::system_category ())
      : boost::system::errc::make_error_code (boost::system::errc::io_error);
  }

  // file_writer
  //
  file_writer::
  file_writer (const filesystem::path& p, bool append)
      : path_ (p)
  {
    // Resume appends to whatever is there. Otherwise truncate so that we
    // don't leave garbage at the end if the file already existed.
    //
    ios_base::openmode m (ios::binary | ios::out);
    m |= (append ? ios::app : ios::trunc);

    errno = 0;
    ofs_.open (p, m);

    if (!ofs_)
      throw boost::system::system_error (last_io_error (),
                                         "unable to open " + p.string ());
  }

  size_t file_writer::
  write (const char* d, size_t n, error_code& ec)
  {
    errno = 0;
    ofs_.write (d, static_cast<streamsize> (n));

    if (!ofs_)
    {
      ec = last_io_error ();
      return 0;
    }

    return n;
  }

  void file_writer::
  close (error_code& ec)
  {
    if (!ofs_.is_open ())
      return;

    errno = 0;
    ofs_.close ();

    if (ofs_.fail ())
      ec = last_io_error ();
  }

  // memory_reader
  //
  asio::awaitable<size_t> memory_reader::
  read_some (asio::mutable_buffer b, error_code& ec)
  {
    ec = error_code ();

    if (pos_ == data_.size ())
    {
      ec = asio::error::eof;
      co_return 0;
    }

    size_t n (min (b.size (), data_.size () - pos_));

    if (chunk_ != 0)
      n = min (n, chunk_);

    memcpy (b.data (), data_.data () + pos_, n);
    pos_ += n;

    co_return n;
  }
}
