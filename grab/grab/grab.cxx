#include <string>
#include <vector>
#include <iostream>
#include <exception>

#include <grab/grab-hash.hxx>
#include <grab/grab-options.hxx>
#include <grab/grab-download.hxx>

#include <grab/version.hxx>

int
main (int argc, char* argv[])
{
  using namespace std;
  using namespace grab;

  try
  {
    // Parse the options anywhere on the command line leaving the command and
    // its arguments in argv.
    //
    options opt (argc,
                 argv,
                 true /* erase */,
                 cli::unknown_mode::fail,
                 cli::unknown_mode::skip);

    // Handle --version.
    //
    if (opt.version ())
    {
      auto& o (cout);

      o << "grab " << GRAB_VERSION_ID << "\n";

      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: grab download [options] <url>..." << "\n"
        << "       grab hash [options] <file>..."    << "\n"
        << "options:"                                << "\n";

      opt.print_usage (o);

      return 0;
    }

    if (argc < 2)
    {
      cerr << "error: command expected" << endl
           << "  info: run 'grab --help' for more information" << endl;
      return 1;
    }

    string cmd (argv[1]);
    vector<string> args (argv + 2, argv + argc);

    if (cmd == "download")
      return download_command (opt, args);

    if (cmd == "hash")
      return hash_command (opt, args);

    cerr << "error: unknown command '" << cmd << "'" << endl
         << "  info: run 'grab --help' for more information" << endl;
    return 1;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
