#include <grab/download/download-error.hxx>

using namespace std;

namespace grab
{
  namespace
  {
    class error_category_impl: public boost::system::error_category
    {
    public:
      const char*
      name () const noexcept override
      {
        return "grab";
      }

      string
      message (int v) const override
      {
        switch (static_cast<error> (v))
        {
        case error::canceled:          return "transfer canceled";
        case error::deadline_exceeded: return "deadline exceeded";
        case error::no_filename:       return "no filename could be determined";
        case error::bad_status:        return "unexpected status code";
        case error::bad_length:        return "bad content length";
        case error::resume_mismatch:   return "unexpected resume offset";
        case error::bad_checksum:      return "checksum mismatch";
        case error::short_write:       return "short write";
        case error::transport_failed:  return "transport failure";
        }

        return "unknown grab error";
      }
    };
  }

  const boost::system::error_category&
  error_category () noexcept
  {
    static const error_category_impl c;
    return c;
  }

  boost::system::error_code
  to_error_code (const std::error_code& ec) noexcept
  {
    if (!ec)
      return boost::system::error_code ();

    // On POSIX both the generic and system categories carry errno values so
    // the value maps one to one.
    //
    if (ec.category () == std::generic_category ())
      return boost::system::error_code (ec.value (),
                                        boost::system::generic_category ());

    return boost::system::error_code (ec.value (),
                                      boost::system::system_category ());
  }
}
