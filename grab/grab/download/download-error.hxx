#pragma once

#include <string>
#include <ostream>
#include <utility>
#include <system_error>
#include <type_traits>

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace grab
{
  // Transfer outcome codes.
  //
  // These are registered with Boost.System (the same way Beast registers its
  // own) so they can be compared against and stored alongside network and
  // filesystem error codes.
  //
  enum class error
  {
    // The scope was canceled explicitly or through a parent.
    //
    canceled = 1,

    // The scope deadline passed.
    //
    deadline_exceeded,

    // No usable file name could be derived from the response or URL.
    //
    no_filename,

    // The server replied with a non-2xx status.
    //
    bad_status,

    // The transferred size does not match the expected size.
    //
    bad_length,

    // The server resumed from an offset other than the one we asked for.
    //
    resume_mismatch,

    // The content digest does not match the expected checksum.
    //
    bad_checksum,

    // A writer accepted fewer bytes than it was given.
    //
    short_write,

    // The transport failed without a more specific error code.
    //
    transport_failed
  };

  const boost::system::error_category&
  error_category () noexcept;

  inline boost::system::error_code
  make_error_code (error e) noexcept
  {
    return boost::system::error_code (static_cast<int> (e), error_category ());
  }

  // Map a standard library error code (std::filesystem and friends) to its
  // Boost.System equivalent.
  //
  boost::system::error_code
  to_error_code (const std::error_code&) noexcept;

  // Terminal error of a transfer.
  //
  struct download_error
  {
    std::string message;
    std::string url;
    boost::system::error_code code;

    download_error () = default;

    download_error (boost::system::error_code c,
                    std::string u,
                    std::string m = std::string ())
        : message (m.empty () ? c.message () : std::move (m)),
          url (std::move (u)),
          code (c) {}
  };

  inline std::ostream&
  operator<< (std::ostream& os, const download_error& e)
  {
    os << e.message;

    if (!e.url.empty ())
      os << " (url: " << e.url << ")";

    return os;
  }
}

namespace boost
{
  namespace system
  {
    template <>
    struct is_error_code_enum<grab::error>: std::true_type {};
  }
}
