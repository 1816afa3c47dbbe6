#include <grab/checksum/checksum-digest.hxx>

#include <cerrno>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

using namespace std;

namespace grab
{
  string
  to_string (hash_algorithm a)
  {
    switch (a)
    {
      case hash_algorithm::none:   return "none";
      case hash_algorithm::md5:    return "md5";
      case hash_algorithm::sha1:   return "sha1";
      case hash_algorithm::sha256: return "sha256";
      case hash_algorithm::sha512: return "sha512";
    }
    return "none";
  }

  hash_algorithm
  to_hash_algorithm (const string& s)
  {
    string l;
    for (char c: s)
      l += static_cast<char> (tolower (static_cast<unsigned char> (c)));

    if (l == "none")   return hash_algorithm::none;
    if (l == "md5")    return hash_algorithm::md5;
    if (l == "sha1")   return hash_algorithm::sha1;
    if (l == "sha256") return hash_algorithm::sha256;
    if (l == "sha512") return hash_algorithm::sha512;

    throw invalid_argument ("unknown hash type '" + s + "'");
  }

  // digest
  //
  digest::
  digest (hash_algorithm a)
      : ctx_ (EVP_MD_CTX_new ())
  {
    const EVP_MD* md (nullptr);

    switch (a)
    {
      case hash_algorithm::md5:    md = EVP_md5 ();    break;
      case hash_algorithm::sha1:   md = EVP_sha1 ();   break;
      case hash_algorithm::sha256: md = EVP_sha256 (); break;
      case hash_algorithm::sha512: md = EVP_sha512 (); break;
      case hash_algorithm::none:
        throw invalid_argument ("no hash algorithm specified");
    }

    if (ctx_ == nullptr || md == nullptr)
      throw runtime_error ("unable to create digest context");

    if (EVP_DigestInit_ex (ctx_.get (), md, nullptr) != 1)
      throw runtime_error ("unable to initialize " + to_string (a) +
                           " digest");
  }

  void digest::
  update (const void* d, size_t n)
  {
    if (EVP_DigestUpdate (ctx_.get (), d, n) != 1)
      throw runtime_error ("unable to update digest");
  }

  string digest::
  hex ()
  {
    unsigned char h[EVP_MAX_MD_SIZE];
    unsigned int n (0);

    if (EVP_DigestFinal_ex (ctx_.get (), h, &n) != 1)
      throw runtime_error ("unable to finalize digest");

    ostringstream os;
    for (unsigned int i (0); i != n; ++i)
      os << std::hex << setw (2) << setfill ('0') << static_cast<int> (h[i]);

    return os.str ();
  }

  string
  file_digest (hash_algorithm a, const filesystem::path& f)
  {
    errno = 0;
    ifstream ifs (f, ios::binary);
    if (!ifs)
      throw system_error (errno != 0 ? errno : EIO,
                          generic_category (),
                          "unable to open " + f.string ());

    digest d (a);

    char buf[8192];
    while (ifs.read (buf, sizeof (buf)) || ifs.gcount () > 0)
      d.update (buf, static_cast<size_t> (ifs.gcount ()));

    if (ifs.bad ())
      throw system_error (EIO, generic_category (),
                          "unable to read " + f.string ());

    return d.hex ();
  }

  bool
  digest_equal (const string& x, const string& y) noexcept
  {
    if (x.size () != y.size ())
      return false;

    for (size_t i (0); i != x.size (); ++i)
    {
      if (tolower (static_cast<unsigned char> (x[i])) !=
          tolower (static_cast<unsigned char> (y[i])))
        return false;
    }

    return true;
  }
}
