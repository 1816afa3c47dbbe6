#pragma once

#include <string>
#include <vector>

#include <grab/grab-options.hxx>

namespace grab
{
  // Print the digest of each file as <hex><two spaces><path>. Return the
  // process exit code.
  //
  int
  hash_command (const options&, const std::vector<std::string>& files);
}
