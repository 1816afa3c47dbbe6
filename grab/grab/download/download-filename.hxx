#pragma once

#include <string>
#include <optional>
#include <filesystem>

#include <boost/system/error_code.hpp>

#include <grab/http/http-url.hxx>
#include <grab/http/http-types.hxx>

namespace grab
{
  // Extract the filename parameter from a Content-Disposition header value.
  //
  // Return nullopt if the value is malformed or has no filename parameter
  // (note: an empty filename is returned as such). The extended filename*
  // parameter (RFC 5987) takes precedence over the plain one.
  //
  std::optional<std::string>
  disposition_filename (const std::string&);

  // Guess the destination file name from the response headers and the
  // effective URL.
  //
  // The Content-Disposition filename wins if the header is well-formed and
  // has one; otherwise the (decoded) URL path is used. The result is reduced
  // to its base name so that a server cannot direct us outside of the
  // destination directory. If no usable name remains, return an empty path
  // and set ec to error::no_filename.
  //
  std::filesystem::path
  guess_filename (const http_headers&,
                  const std::string& url,
                  boost::system::error_code& ec);

  // Parse an HTTP-date (RFC 7231) as used in Last-Modified. All three forms
  // are accepted: IMF-fixdate, RFC 850, and asctime.
  //
  std::optional<std::filesystem::file_time_type>
  parse_http_date (const std::string&);
}
