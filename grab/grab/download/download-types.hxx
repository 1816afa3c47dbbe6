#pragma once

#include <string>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <optional>
#include <filesystem>

#include <grab/download/download-error.hxx>

namespace grab
{
  // Download state machine steps.
  //
  enum class download_state
  {
    resolve_destination,
    probe_remote,
    issue_transfer,
    open_writer,
    stream,
    verify_checksum,
    finalize
  };

  inline std::ostream&
  operator<< (std::ostream& os, download_state s)
  {
    switch (s)
    {
    case download_state::resolve_destination: return os << "resolve";
    case download_state::probe_remote:        return os << "probe";
    case download_state::issue_transfer:      return os << "request";
    case download_state::open_writer:         return os << "open";
    case download_state::stream:              return os << "stream";
    case download_state::verify_checksum:     return os << "verify";
    case download_state::finalize:            return os << "finalize";
    }
    return os;
  }

  // Client configuration shared by all transfers.
  //
  struct client_traits
  {
    // Sent with every request unless the request has its own.
    //
    std::string user_agent = "grab";

    // Default copy buffer size (0 = 32KiB).
    //
    std::size_t buffer_size = 0;

    // Diagnostics level: 0 is silent, 2 and above traces state transitions
    // and HTTP exchanges to stderr.
    //
    std::uint16_t verbosity = 0;
  };

  // Completed transfer summary as delivered by download_batch().
  //
  struct download_response
  {
    std::filesystem::path filename;
    std::optional<download_error> error;
  };

  inline std::ostream&
  operator<< (std::ostream& os, const download_response& r)
  {
    os << r.filename.string ();

    if (r.error)
      os << ": " << *r.error;

    return os;
  }
}
