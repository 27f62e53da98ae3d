// file      : hexmirror/catalog.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <hexmirror/catalog.hxx>

#include <hexmirror/types.hxx>
#include <hexmirror/utility.hxx>

#include <hexmirror/fetch.test.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace hexmirror
{
  static bool
  malformed (const string& s)
  {
    try
    {
      parse_catalog (s, "<test>");
      return false;
    }
    catch (const failed&)
    {
      return true;
    }
  }

  static int
  main (int, char*[])
  {
    verb = 0;

    // Parsing.
    //
    {
      packages ps (parse_catalog (
        R"([
             {"name": "alpha",
              "url": "https://hex.pm/api/packages/alpha",
              "meta": {"licenses": ["MIT"], "links": {}},
              "releases": [{"version": "1.1.0", "has_docs": true},
                           {"version": "1.0.0"}]},
             {"releases": [], "name": "beta"}
           ])",
        "<test>"));

      assert (ps.size () == 2);
      assert (ps[0].name == "alpha");
      assert (ps[0].releases.size () == 2);
      assert (ps[0].releases[0].version == "1.1.0");
      assert (ps[0].releases[1].version == "1.0.0");
      assert (ps[1].name == "beta");
      assert (ps[1].releases.empty ());
    }

    // End of catalog.
    //
    assert (parse_catalog ("[]", "<test>").empty ());
    assert (parse_catalog ("null", "<test>").empty ());
    assert (parse_catalog ("", "<test>").empty ());
    assert (parse_catalog (" \n", "<test>").empty ());

    // Malformed entries.
    //
    assert (malformed ("[{\"releases\": []}]"));
    assert (malformed ("[{\"name\": \"alpha\"}]"));
    assert (malformed ("[{\"name\": 1, \"releases\": []}]"));
    assert (malformed ("[{\"name\": \"alpha\", \"releases\": [{}]}]"));
    assert (malformed ("[{\"name\": \"../etc\", \"releases\": []}]"));
    assert (malformed (
              "[{\"name\": \"a\", \"releases\": [{\"version\": \"1/2\"}]}]"));
    assert (malformed ("[{\"name\": \"alpha\", \"releases\": []}"));
    assert (malformed ("{\"name\": \"alpha\"}"));
    assert (malformed ("[] []"));

    assert (catalog_page_url ("https://hex.pm/api", 3) ==
            "https://hex.pm/api/packages?page=3");
    assert (catalog_page_url ("https://hex.pm/api/", 1) ==
            "https://hex.pm/api/packages?page=1");

    options o;
    o.catalog_url ("https://hex.test/api");

    const string p1 ("https://hex.test/api/packages?page=1");
    const string p2 ("https://hex.test/api/packages?page=2");
    const string p3 ("https://hex.test/api/packages?page=3");
    const string p4 ("https://hex.test/api/packages?page=4");
    const string p5 ("https://hex.test/api/packages?page=5");

    // Rate limiting recovery.
    //
    {
      fake_client c;
      c.add (p1, 429);
      c.add (p1, 429);
      c.add (p1, 200, R"([{"name": "alpha", "releases": []}])");

      size_t pauses (0);
      packages ps (fetch_catalog_page (c, o, 1, [&pauses] () {++pauses;}));

      assert (pauses == 2);
      assert (c.requests (p1) == 3);
      assert (ps.size () == 1 && ps[0].name == "alpha");
    }

    // Other errors are fatal.
    //
    {
      fake_client c;
      c.add (p1, 503);

      bool f (false);
      try
      {
        fetch_catalog_page (c, o, 1, [] () {assert (false);});
      }
      catch (const failed&)
      {
        f = true;
      }

      assert (f);
      assert (c.requests (p1) == 1);
    }

    // Pagination in batches.
    //
    {
      o.catalog_jobs (2);

      fake_client c;
      c.add (p1, 200, R"([{"name": "a", "releases": [{"version": "1"}]},
                          {"name": "b", "releases": []}])");
      c.add (p2, 429);
      c.add (p2, 200, R"([{"name": "c", "releases": []}])");
      c.add (p3, 200, R"([{"name": "d", "releases": []}])");
      c.add (p4, 200, "[]");
      c.add (p5, 200, R"([{"name": "e", "releases": []}])");

      packages ps (fetch_catalog (c, o, [] () {}));

      assert (ps.size () == 4);
      assert (ps[0].name == "a");
      assert (ps[1].name == "b");
      assert (ps[2].name == "c");
      assert (ps[3].name == "d");

      assert (c.requests (p2) == 2);
      assert (c.requests (p4) == 1);
      assert (c.requests (p5) == 0);
    }

    // Empty page in the middle of the batch drops the rest of the batch.
    //
    {
      o.catalog_jobs (3);

      fake_client c;
      c.add (p1, 200, R"([{"name": "a", "releases": []}])");
      c.add (p2, 200, "[]");
      c.add (p3, 200, R"([{"name": "c", "releases": []}])");

      packages ps (fetch_catalog (c, o, [] () {}));

      assert (ps.size () == 1 && ps[0].name == "a");
      assert (c.requests (p3) == 1);
      assert (c.requests (p4) == 0);
    }

    // Pages past the end do not affect the result even if failed.
    //
    {
      o.catalog_jobs (3);

      fake_client c;
      c.add (p1, 200, R"([{"name": "a", "releases": []}])");
      c.add (p2, 200, "[]");
      c.add (p3, 500);

      packages ps (fetch_catalog (c, o, [] () {}));

      assert (ps.size () == 1 && ps[0].name == "a");
      assert (c.requests (p3) == 1);
    }

    // Rate limited pages past the end are not waited for.
    //
    {
      o.catalog_jobs (2);

      fake_client c;
      c.add (p1, 200, "[]");
      c.add (p2, 429);

      auto pause ([] ()
                  {
                    std::this_thread::sleep_for (chrono::milliseconds (1));
                  });

      packages ps (fetch_catalog (c, o, pause));

      assert (ps.empty ());
      assert (c.requests (p1) == 1);
      assert (c.requests (p2) >= 1);
    }

    // Failed page fails the whole catalog.
    //
    {
      o.catalog_jobs (2);

      fake_client c;
      c.add (p1, 200, R"([{"name": "a", "releases": []}])");
      c.add (p2, 200, R"([{"name": "b", "releases": []}])");
      c.add (p3, 200, R"([{"name": "c", "releases": []}])");
      c.add (p4, 500);

      bool f (false);
      try
      {
        fetch_catalog (c, o, [] () {});
      }
      catch (const failed&)
      {
        f = true;
      }

      assert (f);
    }

    // Saving and loading.
    //
    {
      auto_rmdir rm (make_temp_dir ("catalog"));
      path f (rm.path / "hexpm.json");

      packages ps {
        package {"alpha", {release {"1.0.0"}, release {"2.0.0-rc.1"}}},
        package {"beta", {}}};

      save_catalog (ps, f);
      packages ls (load_catalog (f));

      assert (ls.size () == 2);
      assert (ls[0].name == "alpha" && ls[0].releases.size () == 2);
      assert (ls[0].releases[1].version == "2.0.0-rc.1");
      assert (ls[1].name == "beta" && ls[1].releases.empty ());
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return hexmirror::main (argc, argv);
}
