#pragma once

#include <string>
#include <vector>

#include <grab/grab-options.hxx>

namespace grab
{
  // Download the URLs into the output directory. Return the number of failed
  // downloads (capped at 255) as the process exit code.
  //
  int
  download_command (const options&, const std::vector<std::string>& urls);
}
