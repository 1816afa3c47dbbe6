#include <grab/grab-hash.hxx>

#include <iostream>
#include <exception>
#include <stdexcept>
#include <system_error>

#include <grab/checksum/checksum-digest.hxx>

using namespace std;

namespace grab
{
  int
  hash_command (const options& o, const vector<string>& files)
  {
    if (files.empty ())
    {
      cerr << "error: file expected" << endl
           << "  info: run 'grab --help' for more information" << endl;
      return 1;
    }

    hash_algorithm a (to_hash_algorithm (o.type ()));

    if (a == hash_algorithm::none)
      throw invalid_argument ("unknown hash type '" + o.type () + "'");

    int r (0);

    for (const string& f: files)
    {
      try
      {
        cout << file_digest (a, f) << "  " << f << endl;
      }
      catch (const system_error& e)
      {
        cerr << "error: unable to hash " << f << ": " << e.what () << endl;
        r = 1;
      }
    }

    return r;
  }
}
