#pragma once

#include <any>
#include <string>
#include <memory>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <functional>
#include <filesystem>

#include <boost/system/error_code.hpp>

#include <grab/http/http-url.hxx>
#include <grab/http/http-types.hxx>
#include <grab/checksum/checksum-digest.hxx>
#include <grab/transfer/transfer-scope.hxx>
#include <grab/transfer/transfer-limiter.hxx>

namespace grab
{
  class response;

  // Expected content digest.
  //
  struct checksum_spec
  {
    hash_algorithm algorithm;
    std::string expected;      // Hex, case-insensitive.
    bool delete_on_error;
  };

  // Download request.
  //
  // The URL and destination are fixed at construction. Everything else is
  // plain data the caller may set before handing the request over (copies
  // are independent, there is no shared mutable state except for the rate
  // limiter which is meant to be shared).
  //
  class request
  {
  public:
    using hook_type = std::function<boost::system::error_code (response&)>;

    // The destination is either a directory (the file name is then derived
    // from the response) or a file path. An empty destination means the
    // current directory. Throw std::invalid_argument if the URL is invalid.
    //
    request (std::filesystem::path destination, const std::string& url);

    const std::string&
    url () const noexcept
    {
      return url_;
    }

    const http_url&
    parsed_url () const noexcept
    {
      return parsed_url_;
    }

    const std::filesystem::path&
    destination () const noexcept
    {
      return destination_;
    }

    const cancel_scope&
    scope () const noexcept
    {
      return scope_;
    }

    // Return a copy of this request associated with a different scope.
    //
    request
    with_scope (cancel_scope) const;

    // Set the expected checksum. Passing hash_algorithm::none clears it.
    // Throw std::invalid_argument if the expected digest is not a hex
    // string.
    //
    void
    set_checksum (hash_algorithm,
                  std::string expected,
                  bool delete_on_error);

    const std::optional<checksum_spec>&
    checksum () const noexcept
    {
      return checksum_;
    }

    // If the destination file exists, consider the transfer complete without
    // contacting the server.
    //
    bool skip_existing = false;

    // Always download from scratch, truncating any existing file.
    //
    bool no_resume = false;

    // Keep the content in memory (see response::bytes()) and don't touch the
    // filesystem.
    //
    bool no_store = false;

    // Fail instead of creating missing destination directories.
    //
    bool no_create_directories = false;

    // Treat non-2xx responses as success and save their body.
    //
    bool ignore_bad_status_codes = false;

    // Don't set the file modification time from Last-Modified.
    //
    bool ignore_remote_time = false;

    // Expected size, if known. A mismatch with the size the server reports
    // is an error.
    //
    std::optional<std::uint64_t> size;

    // Copy buffer size (0 = client default).
    //
    std::size_t buffer_size = 0;

    // Optional rate limiter, may be shared by several requests.
    //
    std::shared_ptr<rate_limiter> limiter;

    // Caller bookkeeping, never looked at.
    //
    std::string label;
    std::any tag;

    // Additional HTTP request headers.
    //
    http_headers headers;

    // Called right before and right after the content is copied. A non-empty
    // error code returned from a hook fails the transfer.
    //
    hook_type before_copy;
    hook_type after_copy;

  private:
    std::string url_;
    http_url parsed_url_;
    std::filesystem::path destination_;
    cancel_scope scope_;
    std::optional<checksum_spec> checksum_;
  };
}
