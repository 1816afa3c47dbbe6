#pragma once

#include <memory>
#include <string>
#include <vector>
#include <filesystem>

#include <grab/transfer/transfer-scope.hxx>
#include <grab/download/download-types.hxx>
#include <grab/download/download-client.hxx>
#include <grab/download/download-channel.hxx>
#include <grab/download/download-response.hxx>

namespace grab
{
  // Download the URL to the destination (a file or a directory) and wait for
  // the transfer to complete. Throw std::invalid_argument if the URL is
  // invalid. Transfer failures are reported through the response.
  //
  std::shared_ptr<response>
  get (const client&,
       std::filesystem::path destination,
       const std::string& url);

  std::shared_ptr<response>
  get (std::filesystem::path destination, const std::string& url);

  // Download the URLs into the directory using the specified number of
  // workers (see client::do_batch()).
  //
  // The directory is checked once before anything is started: throw
  // std::system_error if it does not exist (or cannot be examined) and
  // std::invalid_argument if it is not a directory or if any of the URLs is
  // invalid.
  //
  std::shared_ptr<response_channel>
  get_batch (const client&,
             const cancel_scope&,
             int workers,
             const std::filesystem::path& directory,
             const std::vector<std::string>& urls);

  using download_channel = channel<download_response>;

  // Download the URLs into the current directory, one worker per URL, and
  // deliver just the file name and error of each transfer. Throw as
  // get_batch().
  //
  std::shared_ptr<download_channel>
  download_batch (const client&,
                  const cancel_scope&,
                  const std::vector<std::string>& urls);

  std::shared_ptr<download_channel>
  download_batch (const cancel_scope&, const std::vector<std::string>& urls);
}
