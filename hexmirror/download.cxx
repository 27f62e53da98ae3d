// file      : hexmirror/download.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <hexmirror/download.hxx>

#include <hexmirror/worker-pool.hxx>
#include <hexmirror/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace hexmirror
{
  string
  to_string (download_status s)
  {
    switch (s)
    {
    case download_status::fetched: return "fetched";
    case download_status::failed:  return "failed";
    case download_status::skipped: return "skipped";
    }

    return string (); // Should never reach.
  }

  download_summary
  summarize (const download_results& rs)
  {
    download_summary r;

    for (download_status s: rs)
    {
      switch (s)
      {
      case download_status::fetched: ++r.fetched; break;
      case download_status::failed:  ++r.failed;  break;
      case download_status::skipped: ++r.skipped; break;
      }
    }

    return r;
  }

  download_status
  download_file (http_client& c, const download_task& t)
  {
    tracer trace ("download_file");

    if (t.url.empty () || t.destination.empty ())
    {
      l4 ([&]{trace << "skipping task '" << t.url << "' -> '"
                    << t.destination << "'";});
      return download_status::skipped;
    }

    const path& f (t.destination);

    // The body is written into the temporary file next to the destination
    // and is only moved into place once completely received. Thus the
    // destination is either absent, the previous version, or complete.
    //
    path tf (f + ".tmp");

    // Only armed once the temporary file is opened for writing.
    //
    auto_rmfile rm;

    try
    {
      uint16_t sc (
        c.get (t.url,
               [&tf, &rm] (istream& is)
               {
                 bool io_read (false);

                 try
                 {
                   ofdstream os (tf,
                                 fdopen_mode::out      |
                                 fdopen_mode::create   |
                                 fdopen_mode::truncate |
                                 fdopen_mode::binary);

                   rm = auto_rmfile (tf);

                   char buf[8192];
                   do
                   {
                     io_read = true;
                     is.read (buf, sizeof (buf));
                     io_read = false;

                     os.write (buf, is.gcount ());
                   }
                   while (!is.eof ());

                   os.close ();
                 }
                 catch (const io_error& e)
                 {
                   // Let the transport diagnose its own failures.
                   //
                   if (io_read)
                     throw;

                   fail << "unable to write to " << tf << ": " << e;
                 }
               }));

      if (!http_success (sc))
      {
        error << "unable to fetch " << t.url <<
          info << "HTTP status code " << sc;

        return download_status::failed;
      }

      mv (tf, f);
      rm.cancel ();
    }
    catch (const failed&)
    {
      // Diagnostics has already been issued and the temporary file (if any)
      // is removed on return.
      //
      return download_status::failed;
    }

    return download_status::fetched;
  }

  download_results
  execute_downloads (http_client& c, const download_tasks& ts, size_t jobs)
  {
    tracer trace ("execute_downloads");

    // Create all the destination directories before starting the workers.
    //
    {
      set<dir_path> ds;
      for (const download_task& t: ts)
      {
        if (!t.url.empty () && !t.destination.empty ())
          ds.insert (t.destination.directory ());
      }

      for (const dir_path& d: ds)
      {
        if (!d.empty ())
          mk_p (d);
      }

      l4 ([&]{trace << "created " << ds.size () << " directories";});
    }

    size_t n (ts.size ());
    atomic<size_t> done (0);

    worker_pool<download_task, download_status> pool (
      jobs,
      [&c, &done, n] (const download_task& t, size_t)
      {
        download_status r (download_file (c, t));

        size_t i (++done);

        if (r == download_status::fetched && verb >= 1)
          text << "fetched [" << i << '/' << n << "] " << t.url;

        return r;
      });

    return pool.run (ts);
  }
}
