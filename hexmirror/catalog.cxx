// file      : hexmirror/catalog.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <hexmirror/catalog.hxx>

#include <limits>  // numeric_limits
#include <sstream>

#include <libbutl/json/parser.hxx>
#include <libbutl/json/serializer.hxx>

#include <hexmirror/worker-pool.hxx>
#include <hexmirror/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace hexmirror
{
  // Package names and versions end up as the mirror file path components.
  //
  static bool
  valid_component (const string& s)
  {
    return !s.empty ()  &&
           s != "."     &&
           s != ".."    &&
           s.find_first_of ("/\\") == string::npos;
  }

  [[noreturn]] static void
  bad_entry (const json::parser& p, const string& name, const string& what)
  {
    fail (location (name, p.line (), p.column ()))
      << "malformed catalog entry: " << what << endf;
  }

  packages
  parse_catalog (istream& is, const string& name)
  {
    packages r;

    // Treat the empty input as an empty catalog.
    //
    is >> std::ws;
    if (is.peek () == istream::traits_type::eof ())
      return r;

    using event = json::event;

    json::parser p (is, name.c_str ());

    try
    {
      if (p.next_expect (event::begin_array, event::null))
      {
        while (p.next_expect (event::begin_object, event::end_array))
        {
          // enter: after begin_object
          // leave: after end_object
          //
          package pkg;
          bool rels (false);

          while (p.next_expect (event::name, event::end_object))
          {
            const string& n (p.name ());

            if (n == "name")
            {
              pkg.name = p.next_expect_string ();

              if (!valid_component (pkg.name))
                bad_entry (p, name, "invalid package name");
            }
            else if (n == "releases")
            {
              p.next_expect (event::begin_array);

              while (p.next_expect (event::begin_object, event::end_array))
              {
                release rel;

                while (p.next_expect (event::name, event::end_object))
                {
                  if (p.name () == "version")
                  {
                    rel.version = p.next_expect_string ();

                    if (!valid_component (rel.version))
                      bad_entry (p, name, "invalid release version");
                  }
                  else
                    p.next_expect_value_skip ();
                }

                if (rel.version.empty ())
                  bad_entry (p, name, "release without version");

                pkg.releases.push_back (move (rel));
              }

              rels = true;
            }
            else
              p.next_expect_value_skip ();
          }

          if (pkg.name.empty ())
            bad_entry (p, name, "package without name");

          if (!rels)
            bad_entry (p, name, "package " + pkg.name + " without releases");

          r.push_back (move (pkg));
        }
      }

      if (p.next ())
        bad_entry (p, name, "unexpected data after package array");
    }
    catch (const json::invalid_json_input& e)
    {
      fail (location (name, e.line, e.column))
        << "malformed catalog entry: " << e;
    }

    return r;
  }

  packages
  parse_catalog (const string& text, const string& name)
  {
    istringstream is (text);
    is.exceptions (istringstream::badbit);
    return parse_catalog (is, name);
  }

  string
  catalog_page_url (const string& u, uint64_t page)
  {
    string r (u);

    if (r.empty () || r.back () != '/')
      r += '/';

    r += "packages?page=";
    r += to_string (page);
    return r;
  }

  // If the end of the catalog is specified, then stop retrying the rate
  // limited request and return nullopt once it is known that the page is
  // past the end.
  //
  static optional<packages>
  fetch_page (http_client& c,
              const options& o,
              uint64_t page,
              const pause_function& pause,
              const atomic<uint64_t>* end)
  {
    tracer trace ("fetch_catalog_page");

    string u (catalog_page_url (o.catalog_url (), page));

    for (;;)
    {
      pair<uint16_t, string> r (fetch_text (c, u));
      uint16_t sc (r.first);

      if (http_success (sc))
      {
        packages ps (parse_catalog (r.second, u));

        l4 ([&]{trace << u << ": " << ps.size () << " packages";});
        return ps;
      }

      if (sc != 429)
        fail << "unable to fetch catalog page " << u <<
          info << "HTTP status code " << sc;

      if (end != nullptr && page > end->load ())
      {
        l4 ([&]{trace << u << " is past the end, not retrying";});
        return nullopt;
      }

      if (verb >= 2)
        text << "rate limited fetching " << u << ", retrying";

      if (pause)
        pause ();
      else
        std::this_thread::sleep_for (chrono::seconds (o.rate_limit_pause ()));
    }
  }

  packages
  fetch_catalog_page (http_client& c,
                      const options& o,
                      uint64_t page,
                      const pause_function& pause)
  {
    optional<packages> r (fetch_page (c, o, page, pause, nullptr));
    return move (*r);
  }

  namespace
  {
    // The fetched page or the failure to fetch it.
    //
    struct catalog_page
    {
      optional<packages> result;
      std::exception_ptr error;
    };
  }

  packages
  fetch_catalog (http_client& c, const options& o, const pause_function& pf)
  {
    tracer trace ("fetch_catalog");

    // The lowest numbered empty page seen so far. Failures to fetch the
    // pages past it do not affect the result.
    //
    atomic<uint64_t> end (numeric_limits<uint64_t>::max ());

    worker_pool<uint64_t, catalog_page> pool (
      o.catalog_jobs (),
      [&c, &o, &pf, &end] (const uint64_t& page, size_t)
      {
        catalog_page r;

        try
        {
          r.result = fetch_page (c, o, page, pf, &end);

          if (r.result && r.result->empty ())
          {
            for (uint64_t e (end.load ()); page < e; )
            {
              if (end.compare_exchange_weak (e, page))
                break;
            }
          }
        }
        catch (const failed&)
        {
          r.error = std::current_exception ();
        }

        return r;
      });

    packages r;

    vector<uint64_t> pages (pool.jobs ());
    for (uint64_t first (1);; first += pages.size ())
    {
      for (size_t i (0); i != pages.size (); ++i)
        pages[i] = first + i;

      vector<catalog_page> rs (pool.run (pages));

      // Stop at the first empty page, dropping the rest of the batch
      // together with its failures.
      //
      auto i (find_if (rs.begin (), rs.end (),
                       [] (const catalog_page& p)
                       {
                         return p.result && p.result->empty ();
                       }));

      for (auto j (rs.begin ()); j != i; ++j)
      {
        // Diagnostics has already been issued.
        //
        if (j->error != nullptr)
          std::rethrow_exception (j->error);

        // Only pages past the end are not fetched.
        //
        assert (j->result);

        packages& ps (*j->result);
        r.insert (r.end (),
                  make_move_iterator (ps.begin ()),
                  make_move_iterator (ps.end ()));
      }

      if (i != rs.end ())
      {
        l4 ([&]{trace << "page " << first + (i - rs.begin ()) << " is empty, "
                      << r.size () << " packages total";});

        if (verb >= 2)
        {
          for (auto j (i + 1); j != rs.end (); ++j)
          {
            if (j->error != nullptr)
              info << "ignoring failure to fetch catalog page "
                   << first + (j - rs.begin ()) << " past the end";
          }
        }

        break;
      }

      if (verb >= 2)
        text << "fetched catalog pages " << first << '-'
             << first + pages.size () - 1 << " (" << r.size ()
             << " packages so far)";
    }

    return r;
  }

  packages
  load_catalog (const path& f)
  {
    try
    {
      ifdstream is (f, ifdstream::badbit);
      packages r (parse_catalog (is, f.string ()));
      is.close ();
      return r;
    }
    catch (const io_error& e)
    {
      fail << "unable to read " << f << ": " << e << endf;
    }
  }

  void
  save_catalog (const packages& ps, const path& f)
  {
    try
    {
      ofdstream os (f);
      auto_rmfile rm (f);

      json::stream_serializer s (os);

      s.begin_array ();

      for (const package& p: ps)
      {
        s.begin_object ();
        s.member ("name", p.name);

        s.member_name ("releases");
        s.begin_array ();
        for (const release& r: p.releases)
        {
          s.begin_object ();
          s.member ("version", r.version);
          s.end_object ();
        }
        s.end_array ();

        s.end_object ();
      }

      s.end_array ();
      os << endl;

      os.close ();
      rm.cancel ();
    }
    catch (const json::invalid_json_output& e)
    {
      fail << "unable to serialize catalog into " << f << ": " << e;
    }
    catch (const io_error& e)
    {
      fail << "unable to write to " << f << ": " << e;
    }
  }
}
