// file      : hexmirror/hexmirror.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <cstdlib>  // getenv()
#include <iostream>
#include <exception> // set_terminate(), terminate_handler

#include <libbutl/version.hxx>  // LIBBUTL_VERSION_ID
#include <libbutl/fdstream.hxx> // stderr_fd(), fdterm()
#include <libbutl/backtrace.hxx> // backtrace()

#include <hexmirror/types.hxx>
#include <hexmirror/utility.hxx>

#include <hexmirror/plan.hxx>
#include <hexmirror/fetch.hxx>
#include <hexmirror/catalog.hxx>
#include <hexmirror/manifest.hxx>
#include <hexmirror/download.hxx>
#include <hexmirror/diagnostics.hxx>
#include <hexmirror/hexmirror-options.hxx>

using namespace std;
using namespace butl;

namespace hexmirror
{
  // Print the backtrace before terminating.
  //
  // Note: custom_terminate is non-static and not a lambda to reduce the noise.
  //
  static std::terminate_handler default_terminate;

  void
  custom_terminate ()
  {
    *diag_stream << backtrace ();

    if (default_terminate != nullptr)
      default_terminate ();
  }

  static uint16_t
  verbosity (const options& o)
  {
    if (o.verbose_specified ())
      return o.verbose ();

    return o.V () ? 3 : o.v () ? 2 : o.quiet () ? 0 : 1;
  }

  static manifest_specs
  manifests (const options& o)
  {
    manifest_specs r;

    if (!o.manifest_specified ())
    {
      r.push_back (manifest_spec {"hex-1.x", "hex", ".ez"});
      return r;
    }

    for (const string& s: o.manifest ())
    try
    {
      r.push_back (parse_manifest_spec (s));
    }
    catch (const invalid_argument& e)
    {
      fail << "invalid --manifest option value '" << s << "': " << e;
    }

    return r;
  }

  static packages
  obtain_catalog (http_client& c, const options& o, bool load)
  {
    const path& f (o.catalog_file ());

    if (load && exists (f))
    {
      if (verb >= 1)
        text << "loading catalog from " << f;

      return load_catalog (f);
    }

    if (verb >= 1)
      text << "fetching catalog from " << o.catalog_url ();

    packages r (fetch_catalog (c, o));

    if (verb >= 1)
      text << "fetched " << r.size () << " packages";

    return r;
  }

  // Return all the tasks for the mirror: the manifest files, the catalog
  // files, and the auxiliary files, in this order. Unless this is a dry run,
  // the resolved manifests are saved into the mirror.
  //
  static download_tasks
  plan_downloads (http_client& c,
                  const options& o,
                  const mirror_layout& ml,
                  const packages& ps,
                  const manifest_specs& ms,
                  bool dry_run)
  {
    download_tasks r;

    for (const manifest_spec& m: ms)
    {
      download_tasks ts (resolve_manifest (c, o, ml, m, !dry_run));
      r.insert (r.end (),
                make_move_iterator (ts.begin ()),
                make_move_iterator (ts.end ()));
    }

    {
      download_tasks ts (plan_catalog_downloads (ps, ml));
      r.insert (r.end (),
                make_move_iterator (ts.begin ()),
                make_move_iterator (ts.end ()));
    }

    strings ns;
    for (const manifest_spec& m: ms)
      ns.push_back (m.name);

    download_tasks ts (auxiliary_downloads (ml, ns));
    r.insert (r.end (),
              make_move_iterator (ts.begin ()),
              make_move_iterator (ts.end ()));

    return r;
  }

  static int
  cmd_download (const options& o)
  {
    mirror_layout ml (normalize (o.directory (), "mirror"), o.repo_url ());
    manifest_specs ms (manifests (o));

    curl_client c (o);

    packages ps (obtain_catalog (c, o, true /* load */));
    download_tasks ts (plan_downloads (c, o, ml, ps, ms, false /* dry_run */));

    if (verb >= 1)
      text << "downloading " << ts.size () << " new files from "
           << ml.repo_url () << " (from total of " << catalog_file_count (ps)
           << ")";

    download_summary s (summarize (execute_downloads (c, ts, o.jobs ())));

    if (verb >= 1)
      text << "fetched " << s.fetched << ", failed " << s.failed
           << ", skipped " << s.skipped;

    return s.failed != 0 ? 1 : 0;
  }

  static int
  cmd_list (const options& o)
  {
    curl_client c (o);

    packages ps (obtain_catalog (c, o, false /* load */));
    save_catalog (ps, o.catalog_file ());

    if (verb >= 1)
      text << "saved catalog as " << o.catalog_file ();

    return 0;
  }

  static int
  cmd_plan (const options& o)
  {
    mirror_layout ml (normalize (o.directory (), "mirror"), o.repo_url ());
    manifest_specs ms (manifests (o));

    curl_client c (o);

    packages ps (obtain_catalog (c, o, true /* load */));

    try
    {
      cout.exceptions (ostream::badbit | ostream::failbit);

      for (const download_task& t:
             plan_downloads (c, o, ml, ps, ms, true /* dry_run */))
        cout << t.url << ' ' << t.destination << '\n';

      cout.flush ();
    }
    catch (const io_error& e)
    {
      fail << "unable to write to stdout: " << e;
    }

    return 0;
  }

  int
  main (int argc, char* argv[]);
}

int hexmirror::
main (int argc, char* argv[])
try
{
  using namespace cli;

  default_terminate = set_terminate (custom_terminate);

  if (fdterm (stderr_fd ()))
    stderr_term = std::getenv ("TERM");

  argv_file_scanner scan (argc, argv, "--options-file");

  // First parse the options preceding the command and --version/--help.
  //
  options o;
  o.parse (scan, unknown_mode::stop);

  if (o.version ())
  {
    cout << "hexmirror " << HEXMIRROR_VERSION_ID << endl
         << "libbutl " << LIBBUTL_VERSION_ID << endl
         << "Copyright (c) " << HEXMIRROR_COPYRIGHT << "." << endl
         << "This is free software released under the MIT license." << endl;
    return 0;
  }

  if (o.help ())
  {
    cout << "usage: hexmirror [<options>] <command>" << endl
         << endl
         << "commands: download, list, plan" << endl
         << endl;

    options::print_usage (cout);
    return 0;
  }

  // The next argument should be a command.
  //
  if (!scan.more ())
    fail << "hexmirror command expected" <<
      info << "run 'hexmirror --help' for more information";

  int cmd_argc (2);
  char* cmd_argv[] {argv[0], const_cast<char*> (scan.next ())};
  commands cmd;
  cmd.parse (cmd_argc, cmd_argv, true, unknown_mode::stop);

  if (cmd_argc != 1)
    fail << "unknown hexmirror command/option '" << cmd_argv[1] << "'" <<
      info << "run 'hexmirror --help' for more information";

  // The options may also follow the command.
  //
  o.parse (scan, unknown_mode::fail, unknown_mode::stop);

  if (scan.more ())
    fail << "unexpected argument '" << scan.next () << "'" <<
      info << "run 'hexmirror --help' for more information";

  // Global initializations.
  //
  verb = verbosity (o);

  // Handle commands.
  //
  if (cmd.download ())
    return cmd_download (o);

  if (cmd.list ())
    return cmd_list (o);

  if (cmd.plan ())
    return cmd_plan (o);

  assert (false);
  fail << "unhandled command" << endf;
}
catch (const failed& e)
{
  return e.code; // Diagnostics has already been issued.
}
catch (const cli::exception& e)
{
  error << e;
  return 1;
}

int
main (int argc, char* argv[])
{
  return hexmirror::main (argc, argv);
}
