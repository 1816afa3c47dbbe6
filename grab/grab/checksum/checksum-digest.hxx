#pragma once

#include <string>
#include <memory>
#include <cstddef>
#include <ostream>
#include <filesystem>

#include <openssl/evp.h>

namespace grab
{
  // Supported digest algorithms.
  //
  enum class hash_algorithm
  {
    none,
    md5,
    sha1,
    sha256,
    sha512
  };

  std::string
  to_string (hash_algorithm);

  // Parse an algorithm name (case-insensitive). Throw std::invalid_argument
  // if the name is not recognized.
  //
  hash_algorithm
  to_hash_algorithm (const std::string&);

  inline std::ostream&
  operator<< (std::ostream& o, hash_algorithm a)
  {
    return o << to_string (a);
  }

  // Incremental message digest.
  //
  // Thin RAII wrapper around the OpenSSL EVP digest API. OpenSSL failures are
  // reported as std::runtime_error.
  //
  class digest
  {
  public:
    explicit
    digest (hash_algorithm);

    digest (const digest&) = delete;
    digest& operator= (const digest&) = delete;

    void
    update (const void* data, std::size_t size);

    void
    update (const std::string& s)
    {
      update (s.data (), s.size ());
    }

    // Finalize and return the lower-case hex representation. The digest
    // cannot be updated afterwards.
    //
    std::string
    hex ();

  private:
    struct deleter
    {
      void
      operator() (EVP_MD_CTX* c) const noexcept
      {
        EVP_MD_CTX_free (c);
      }
    };

    std::unique_ptr<EVP_MD_CTX, deleter> ctx_;
  };

  // Compute the hex digest of a file's content. Throw std::system_error if
  // the file cannot be read.
  //
  std::string
  file_digest (hash_algorithm, const std::filesystem::path&);

  // Compare two hex digests ignoring case.
  //
  bool
  digest_equal (const std::string&, const std::string&) noexcept;
}
