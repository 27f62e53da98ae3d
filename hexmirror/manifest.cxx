// file      : hexmirror/manifest.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <hexmirror/manifest.hxx>

#include <map>

#include <hexmirror/checksum.hxx>
#include <hexmirror/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace hexmirror
{
  manifest_spec
  parse_manifest_spec (const string& s)
  {
    size_t p1 (s.find (':'));
    size_t p2 (p1 != string::npos ? s.find (':', p1 + 1) : string::npos);

    if (p2 == string::npos)
      throw invalid_argument ("<name>:<prefix>:<suffix> expected");

    manifest_spec r {string (s, 0, p1),
                     string (s, p1 + 1, p2 - p1 - 1),
                     string (s, p2 + 1)};

    if (r.name.empty ())
      throw invalid_argument ("empty manifest name");

    if (r.prefix.empty ())
      throw invalid_argument ("empty file prefix");

    if (r.name.find ('/') != string::npos   ||
        r.prefix.find ('/') != string::npos ||
        r.suffix.find ('/') != string::npos)
      throw invalid_argument ("directory separator in manifest name, "
                              "prefix, or suffix");

    return r;
  }

  manifest_rows
  parse_manifest (const string& text, const string& name)
  {
    manifest_rows r;

    uint64_t ln (0);
    for (size_t b (0), e; b < text.size (); b = e + 1)
    {
      ++ln;

      e = text.find ('\n', b);
      if (e == string::npos)
        e = text.size ();

      string l (text, b, e - b);

      if (trim (l).empty ())
        continue;

      strings fs;
      for (size_t p (0);; )
      {
        size_t n (l.find (',', p));
        string f (l, p, n != string::npos ? n - p : string::npos);
        fs.push_back (move (trim (f)));

        if (n == string::npos)
          break;

        p = n + 1;
      }

      if (fs.size () != 3)
        fail (location (name, ln, 0))
          << "malformed manifest row: " << fs.size () << " fields instead "
          << "of 3" <<
          info << "expected <target-version>,<digest>,<tool-version>";

      for (const string& f: fs)
      {
        if (f.empty ())
          fail (location (name, ln, 0)) << "malformed manifest row: empty "
                                        << "field";
      }

      // The versions end up as the mirror file path components.
      //
      for (const string* v: {&fs[0], &fs[2]})
      {
        if (*v == "." || *v == ".." || v->find_first_of ("/\\") != string::npos)
          fail (location (name, ln, 0)) << "malformed manifest row: invalid "
                                        << "version '" << *v << "'";
      }

      r.push_back (manifest_row {move (fs[0]), move (fs[1]), move (fs[2])});
    }

    return r;
  }

  manifest_files
  manifest_downloads (const manifest_rows& rs,
                      const mirror_layout& ml,
                      const manifest_spec& ms)
  {
    manifest_files r;
    std::map<path, size_t> index; // Destination to position in r.

    for (const manifest_row& mr: rs)
    {
      download_task t (ml.task ("installs/" + mr.tool_version + '/' +
                                ms.prefix + '-' + mr.target_version +
                                ms.suffix));

      auto i (index.find (t.destination));

      if (i == index.end ())
      {
        index.emplace (t.destination, r.size ());
        r.push_back (manifest_file {move (t), set<string> {mr.digest}});
      }
      else
        r[i->second].digests.insert (mr.digest);
    }

    return r;
  }

  void
  save_manifest (const path& f, const string& s)
  {
    mk_p (f.directory ());

    auto_rmfile rm (f + ".tmp");
    const path& tf (rm.path);

    try
    {
      ofdstream os (tf,
                    fdopen_mode::out      |
                    fdopen_mode::create   |
                    fdopen_mode::truncate |
                    fdopen_mode::binary);
      os << s;
      os.close ();
    }
    catch (const io_error& e)
    {
      fail << "unable to write to " << tf << ": " << e;
    }

    mv (tf, f);
    rm.cancel ();
  }

  download_tasks
  resolve_manifest (http_client& c,
                    const options& o,
                    const mirror_layout& ml,
                    const manifest_spec& ms,
                    bool save)
  {
    tracer trace ("resolve_manifest");

    download_task mt (ml.task ("installs/" + ms.name + ".csv"));

    manifest_files fs;

    // Failure to resolve the manifest only affects the files it lists.
    //
    try
    {
      pair<uint16_t, string> t (fetch_text (c, mt.url));

      if (!http_success (t.first))
      {
        error << "unable to fetch manifest " << mt.url <<
          info << "HTTP status code " << t.first;

        return download_tasks ();
      }

      fs = manifest_downloads (parse_manifest (t.second, mt.url), ml, ms);

      // Mirror the manifest as fetched so that it matches the files
      // resolved from it.
      //
      if (save)
        save_manifest (mt.destination, t.second);
    }
    catch (const failed&)
    {
      // Diagnostics has already been issued.
      //
      info << "files of manifest " << ms.name << " are not mirrored";
      return download_tasks ();
    }

    download_tasks r;

    for (manifest_file& f: fs)
    {
      const path& d (f.task.destination);

      bool up (any_of (f.digests.begin (), f.digests.end (),
                       [&o, &d] (const string& h)
                       {
                         return verify_checksum (o, d, h);
                       }));

      l5 ([&]{trace << d << (up ? " is up to date" : " is missing or stale");});

      if (!up)
        r.push_back (move (f.task));
    }

    l4 ([&]{trace << mt.url << ": " << fs.size () << " files, " << r.size ()
                  << " to fetch";});

    return r;
  }
}
