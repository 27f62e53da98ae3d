// file      : hexmirror/checksum.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <hexmirror/checksum.hxx>

#include <hexmirror/openssl.hxx>
#include <hexmirror/diagnostics.hxx>

using namespace std;

namespace hexmirror
{
  string
  sha256sum (const path& f)
  {
    ifdstream is (f, fdopen_mode::binary, ifdstream::badbit);

    sha256 cs;
    char buf[8192];

    do
    {
      is.read (buf, sizeof (buf));
      cs.append (buf, static_cast<size_t> (is.gcount ()));
    }
    while (!is.eof ());

    is.close ();
    return cs.string ();
  }

  optional<string>
  sha512sum (const options& o, const path& f)
  {
    const string& fs (f.string ());

    // Note that -r makes openssl print the sum in the coreutils format,
    // with the sum as the first word.
    //
    process pr (start_openssl (o,
                               "dgst",
                               cstrings ({"-sha512", "-r", fs.c_str ()}),
                               false /* in */,
                               true  /* out */));

    try
    {
      ifdstream is (move (pr.in_ofd), fdstream_mode::skip);

      string s;
      is >> s;
      is.close ();

      if (pr.wait ())
      {
        if (s.size () != 128)
          fail << "'" << s << "' doesn't appear to be a SHA512 sum" <<
            info << "produced by '" << o.openssl () << "'; use --openssl to "
                 << "override";

        return s;
      }

      // Child exited with an error, fall through.
    }
    // Ignore these exceptions if the child process exited with an error status
    // since that's the source of the failure.
    //
    catch (const io_error&)
    {
      if (pr.wait ())
        fail << "unable to read '" << o.openssl () << "' output";
    }

    // We should only get here if the child exited with an error status.
    //
    assert (!pr.wait ());

    return nullopt;
  }

  bool
  verify_checksum (const options& o, const path& f, const string& digest)
  {
    tracer trace ("verify_checksum");

    if (!exists (f, true /* ignore_error */))
      return false;

    string s;
    switch (digest.size ())
    {
    case 64:
      {
        try
        {
          s = sha256sum (f);
        }
        catch (const io_error& e)
        {
          warn << "unable to read " << f << ": " << e;
          return false;
        }

        break;
      }
    case 128:
      {
        optional<string> r (sha512sum (o, f));

        if (!r)
        {
          warn << "unable to calculate SHA512 sum of " << f;
          return false;
        }

        s = move (*r);
        break;
      }
    default:
      {
        l4 ([&]{trace << "unrecognized checksum '" << digest << "' for "
                      << f;});
        return false;
      }
    }

    bool r (icasecmp (s, digest) == 0);

    l5 ([&]{trace << f << ": " << s << (r ? " matches " : " differs from ")
                  << digest;});

    return r;
  }
}
