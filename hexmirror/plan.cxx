// file      : hexmirror/plan.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <hexmirror/plan.hxx>

#include <hexmirror/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace hexmirror
{
  mirror_layout::
  mirror_layout (dir_path r, string u)
      : root_ (move (r)), repo_url_ (move (u))
  {
    while (!repo_url_.empty () && repo_url_.back () == '/')
      repo_url_.pop_back ();
  }

  download_task mirror_layout::
  task (const string& f) const
  {
    return download_task {repo_url_ + '/' + f, local (f)};
  }

  string mirror_layout::
  package_file (const package& p)
  {
    return "packages/" + p.name;
  }

  string mirror_layout::
  tarball_file (const package& p, const release& r)
  {
    return "tarballs/" + p.name + '-' + r.version + ".tar";
  }

  download_tasks
  plan_catalog_downloads (const packages& ps, const mirror_layout& ml)
  {
    tracer trace ("plan_catalog_downloads");

    download_tasks r;

    for (const package& p: ps)
    {
      bool dirty (false);

      for (const release& rl: p.releases)
      {
        download_task t (ml.task (mirror_layout::tarball_file (p, rl)));

        if (!exists (t.destination))
        {
          l5 ([&]{trace << "missing " << t.destination;});

          r.push_back (move (t));
          dirty = true;
        }
      }

      // The package file lists the package releases so refetch it if any
      // new release tarball appeared.
      //
      download_task t (ml.task (mirror_layout::package_file (p)));

      if (dirty || !exists (t.destination))
      {
        l5 ([&]{trace << (dirty ? "stale " : "missing ") << t.destination;});
        r.push_back (move (t));
      }
    }

    return r;
  }

  size_t
  catalog_file_count (const packages& ps)
  {
    size_t r (ps.size ());

    for (const package& p: ps)
      r += p.releases.size ();

    return r;
  }

  download_tasks
  auxiliary_downloads (const mirror_layout& ml, const strings& ms)
  {
    download_tasks r {
      ml.task ("names"),
      ml.task ("versions"),
      ml.task ("public_key")};

    // The manifest itself is saved when resolved.
    //
    for (const string& m: ms)
      r.push_back (ml.task ("installs/" + m + ".csv.signed"));

    return r;
  }
}
