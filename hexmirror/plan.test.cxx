// file      : hexmirror/plan.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <hexmirror/plan.hxx>

#include <hexmirror/types.hxx>
#include <hexmirror/utility.hxx>

#include <hexmirror/fetch.test.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace hexmirror
{
  static int
  main (int, char*[])
  {
    verb = 0;

    auto_rmdir rm (make_temp_dir ("plan"));
    const dir_path& d (rm.path);

    mirror_layout ml (d, "https://repo.test//");
    assert (ml.repo_url () == "https://repo.test");

    packages ps {
      package {"alpha", {release {"1.0"}, release {"2.0"}}},
      package {"beta", {release {"0.1.0"}}},
      package {"gamma", {}}};

    assert (catalog_file_count (ps) == 6);
    assert (catalog_file_count (packages ()) == 0);

    // Empty mirror.
    //
    {
      download_tasks ts (plan_catalog_downloads (ps, ml));

      assert (ts.size () == 6);

      assert (ts[0].url == "https://repo.test/tarballs/alpha-1.0.tar");
      assert (ts[0].destination ==
              d / dir_path ("tarballs") / path ("alpha-1.0.tar"));
      assert (ts[1].url == "https://repo.test/tarballs/alpha-2.0.tar");
      assert (ts[2].url == "https://repo.test/packages/alpha");
      assert (ts[2].destination ==
              d / dir_path ("packages") / path ("alpha"));
      assert (ts[3].url == "https://repo.test/tarballs/beta-0.1.0.tar");
      assert (ts[4].url == "https://repo.test/packages/beta");
      assert (ts[5].url == "https://repo.test/packages/gamma");
    }

    mk_p (d / dir_path ("packages"));
    mk_p (d / dir_path ("tarballs"));

    for (const char* f: {"packages/alpha",
                         "packages/beta",
                         "packages/gamma",
                         "tarballs/alpha-1.0.tar",
                         "tarballs/alpha-2.0.tar",
                         "tarballs/beta-0.1.0.tar"})
      write_file (ml.local (f), f);

    // Complete mirror.
    //
    assert (plan_catalog_downloads (ps, ml).empty ());
    assert (plan_catalog_downloads (ps, ml).empty ());

    // Missing release tarball makes the package file stale.
    //
    {
      butl::try_rmfile (ml.local ("tarballs/alpha-2.0.tar"));

      download_tasks ts (plan_catalog_downloads (ps, ml));

      assert (ts.size () == 2);
      assert (ts[0].url == "https://repo.test/tarballs/alpha-2.0.tar");
      assert (ts[1].url == "https://repo.test/packages/alpha");
    }

    // Missing package file alone.
    //
    {
      write_file (ml.local ("tarballs/alpha-2.0.tar"), "alpha");
      butl::try_rmfile (ml.local ("packages/gamma"));

      download_tasks ts (plan_catalog_downloads (ps, ml));

      assert (ts.size () == 1);
      assert (ts[0].url == "https://repo.test/packages/gamma");
    }

    // New release in the catalog.
    //
    {
      write_file (ml.local ("packages/gamma"), "gamma");
      ps[1].releases.push_back (release {"0.2.0"});

      download_tasks ts (plan_catalog_downloads (ps, ml));

      assert (ts.size () == 2);
      assert (ts[0].url == "https://repo.test/tarballs/beta-0.2.0.tar");
      assert (ts[1].url == "https://repo.test/packages/beta");
    }

    // Auxiliary files.
    //
    {
      download_tasks ts (auxiliary_downloads (ml, strings {"hex-1.x"}));

      assert (ts.size () == 4);
      assert (ts[0].url == "https://repo.test/names");
      assert (ts[0].destination == d / path ("names"));
      assert (ts[1].url == "https://repo.test/versions");
      assert (ts[2].url == "https://repo.test/public_key");
      assert (ts[3].url == "https://repo.test/installs/hex-1.x.csv.signed");
      assert (ts[3].destination ==
              d / dir_path ("installs") / path ("hex-1.x.csv.signed"));

      // The manifest itself is mirrored when resolved.
      //
      for (const download_task& t: ts)
        assert (t.url != "https://repo.test/installs/hex-1.x.csv");

      assert (auxiliary_downloads (ml, strings ()).size () == 3);
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return hexmirror::main (argc, argv);
}
