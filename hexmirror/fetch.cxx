// file      : hexmirror/fetch.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <hexmirror/fetch.hxx>

#include <libbutl/curl.hxx>

#include <hexmirror/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace hexmirror
{
  http_client::
  ~http_client ()
  {
  }

  pair<uint16_t, string>
  fetch_text (http_client& c, const string& url)
  {
    string r;

    // Note that the read errors are diagnosed by the transport.
    //
    uint16_t sc (
      c.get (url,
             [&r] (istream& is)
             {
               char buf[8192];
               do
               {
                 is.read (buf, sizeof (buf));
                 r.append (buf, static_cast<size_t> (is.gcount ()));
               }
               while (!is.eof ());
             }));

    return make_pair (sc, move (r));
  }

  // curl
  //
  static bool
  check_curl (const path& prog)
  {
    // curl --version prints the version to stdout and exits with 0
    // status. The first line starts with "curl X.Y.Z"
    //
    const char* args[] = {prog.string ().c_str (), "--version", nullptr};

    try
    {
      process_path pp (process::path_search (args[0]));

      if (verb >= 3)
        print_process (args);

      process pr (pp, args, 0, -1); // Redirect stdout to a pipe.

      try
      {
        ifdstream is (move (pr.in_ofd), fdstream_mode::skip);

        string l;
        getline (is, l);
        is.close ();

        return pr.wait () && l.compare (0, 5, "curl ") == 0;
      }
      catch (const io_error&)
      {
        // Fall through.
      }
    }
    catch (const process_error& e)
    {
      if (e.child)
        exit (1);

      // Fall through.
    }

    return false;
  }

  // Cache the result of testing the curl program. Note that the check is
  // performed on the first request and the requests can be issued from
  // multiple threads.
  //
  static std::once_flag curl_checked;

  process curl_client::
  start (const string& url)
  {
    const path& prog (ops_.curl ());

    std::call_once (curl_checked,
                    [&prog] ()
                    {
                      if (!check_curl (prog))
                        fail << prog << " does not appear to be the 'curl' "
                             << "program" <<
                          info << "use --curl to specify the curl program "
                               << "location";
                    });

    cstrings args {
      prog.string ().c_str (),
      "-L", // Follow redirects.
      "-A", HEXMIRROR_USER_AGENT " curl"
    };

    // Map verbosity level. Unless the progress is requested explicitly for an
    // interactive run we run curl quiet since many transfers are normally in
    // progress simultaneously. At the verbosity levels higher than 3 run it
    // verbose.
    //
    if (!(verb == 1 && stderr_term && ops_.progress () && !ops_.no_progress ()))
    {
      args.push_back ("-s");
      args.push_back ("-S"); // But show errors.
    }

    if (verb > 3)
      args.push_back ("-v");

    // Set download timeout if requested.
    //
    string tm;
    if (ops_.fetch_timeout_specified ())
    {
      tm = to_string (ops_.fetch_timeout ());
      args.push_back ("--max-time");
      args.push_back (tm.c_str ());
    }

    // Add extra options. The idea is that they may override what
    // we have set before this point but not after.
    //
    for (const string& o: ops_.curl_option ())
      args.push_back (o.c_str ());

    // Include the HTTP response status line and headers to the output. Note
    // that we don't pass --fail|-f since we need to see the status code of
    // the failed requests (429 in particular).
    //
    args.push_back ("-i");

    args.push_back (url.c_str ());
    args.push_back (nullptr);

    try
    {
      process_path pp (process::path_search (args[0]));

      if (verb >= 3)
        print_process (args);

      // Redirect stdout to a pipe.
      //
      return process (pp, args.data (), 0, -1, 2);
    }
    catch (const process_error& e)
    {
      error << "unable to execute " << prog << ": " << e;

      if (e.child)
        exit (1);

      throw failed ();
    }
  }

  uint16_t curl_client::
  get (const string& url, const function<void (istream&)>& body)
  {
    process pr (start (url));

    uint16_t sc (0);

    try
    {
      ifdstream is (move (pr.in_ofd),
                    fdstream_mode::skip | fdstream_mode::binary,
                    ifdstream::badbit);

      try
      {
        sc = curl::read_http_status (is).code;
      }
      catch (const invalid_argument& e)
      {
        is.close ();

        // If curl failed, then it is the source of the failure (connection
        // refused, etc) and has already issued the diagnostics.
        //
        if (pr.wait ())
          fail << "unable to read HTTP response status line for " << url
               << ": " << e;

        fail << "unable to fetch " << url <<
          info << "re-run with -v for more information";
      }

      if (http_success (sc))
        body (is);

      // Close the stream, skipping the remaining content, if present.
      //
      is.close ();
    }
    catch (const io_error& e)
    {
      if (pr.wait ())
        fail << "unable to read fetched " << url << ": " << e;

      // Fall through.
    }

    // Note that since we don't pass --fail, curl exits with the error status
    // only if the transfer itself has failed, in which case the body could
    // have been truncated.
    //
    if (!pr.wait ())
    {
      // While it is reasonable to assuming the child process issued
      // diagnostics, some may not mention the URL.
      //
      fail << "unable to fetch " << url <<
        info << "re-run with -v for more information";
    }

    return sc;
  }
}
