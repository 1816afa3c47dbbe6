#pragma once

#include <string>

namespace grab
{
  // URL components as far as an HTTP exchange is concerned.
  //
  struct http_url
  {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target; // Path and query, always starts with '/'.

    bool
    secure () const noexcept
    {
      return scheme == "https";
    }

    // Percent-decoded path without the query.
    //
    std::string
    path () const;

    // Recompose the URL (without the fragment).
    //
    std::string
    string () const;
  };

  // Parse and validate a URL string.
  //
  // The scheme defaults to http if the string has none. Throw
  // std::invalid_argument if the URL is syntactically broken (empty, bad
  // scheme, control characters, invalid escape sequences, non-numeric port).
  // Note that an unsupported but well-formed scheme (ftp://) is accepted here
  // and only rejected when we try to talk to it.
  //
  http_url
  parse_url (const std::string&);

  // Resolve a (possibly relative) reference, such as a Location header value,
  // against an absolute base URL.
  //
  std::string
  resolve_url (const http_url& base, const std::string& ref);

  // Decode %XX escape sequences. Throw std::invalid_argument on a malformed
  // sequence.
  //
  std::string
  percent_decode (const std::string&);
}
