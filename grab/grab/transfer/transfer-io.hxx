#pragma once

#include <string>
#include <utility>
#include <cstddef>
#include <fstream>
#include <filesystem>

#include <boost/asio/buffer.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace grab
{
  namespace asio = boost::asio;

  // Byte source.
  //
  class reader
  {
  public:
    virtual
    ~reader () = default;

    // Read up to buffer_size(b) bytes into b and return the number of bytes
    // read. A short read with no error is valid. The end of the stream is
    // signaled with asio::error::eof (and zero bytes).
    //
    virtual asio::awaitable<std::size_t>
    read_some (asio::mutable_buffer b, boost::system::error_code& ec) = 0;

    // Release the underlying resources. Reading after close is undefined.
    //
    virtual void
    close () noexcept {}
  };

  // Byte sink.
  //
  class writer
  {
  public:
    virtual
    ~writer () = default;

    // Write n bytes and return the number of bytes actually written which is
    // less than n only if ec is set (or the writer is misbehaving, which the
    // caller treats as a short write).
    //
    virtual std::size_t
    write (const char* d, std::size_t n, boost::system::error_code& ec) = 0;

    virtual void
    close (boost::system::error_code&) {}
  };

  // File sink.
  //
  // Open the file for appending or create/truncate it. Throw
  // boost::system::system_error if the file cannot be opened.
  //
  class file_writer: public writer
  {
  public:
    file_writer (const std::filesystem::path&, bool append);

    std::size_t
    write (const char*, std::size_t, boost::system::error_code&) override;

    void
    close (boost::system::error_code&) override;

  private:
    std::filesystem::path path_;
    std::ofstream ofs_;
  };

  // In-memory sink.
  //
  class memory_writer: public writer
  {
  public:
    std::size_t
    write (const char* d, std::size_t n, boost::system::error_code&) override
    {
      data_.append (d, n);
      return n;
    }

    const std::string&
    data () const noexcept
    {
      return data_;
    }

    std::string
    release () noexcept
    {
      return std::move (data_);
    }

  private:
    std::string data_;
  };

  // In-memory source, optionally handing out at most chunk bytes per read.
  //
  class memory_reader: public reader
  {
  public:
    explicit
    memory_reader (std::string data, std::size_t chunk = 0)
        : data_ (std::move (data)), chunk_ (chunk) {}

    asio::awaitable<std::size_t>
    read_some (asio::mutable_buffer, boost::system::error_code&) override;

  private:
    std::string data_;
    std::size_t chunk_;
    std::size_t pos_ = 0;
  };
}
