// file      : hexmirror/utility.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <hexmirror/utility.hxx>

#include <hexmirror/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace hexmirror
{
  dir_path&
  normalize (dir_path& d, const char* what)
  {
    try
    {
      if (!d.complete ().normalized ())
        d.normalize ();
    }
    catch (const invalid_path& e)
    {
      fail << "invalid " << what << " directory " << e.path;
    }
    catch (const system_error& e)
    {
      fail << "unable to obtain current directory: " << e;
    }

    return d;
  }

  optional<const char*> stderr_term = nullopt;

  bool
  exists (const path& f, bool ignore_error)
  {
    try
    {
      return file_exists (f, true /* follow_symlinks */, ignore_error);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << f << ": " << e << endf;
    }
  }

  bool
  exists (const dir_path& d, bool ignore_error)
  {
    try
    {
      return dir_exists (d, ignore_error);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << d << ": " << e << endf;
    }
  }

  void
  mk_p (const dir_path& d)
  {
    if (verb >= 3)
      text << "mkdir -p " << d;

    try
    {
      try_mkdir_p (d);
    }
    catch (const system_error& e)
    {
      fail << "unable to create directory " << d << ": " << e;
    }
  }

  void
  mv (const path& from, const path& to)
  {
    if (verb >= 3)
      text << "mv " << from << ' ' << to;

    try
    {
      mvfile (from, to,
              cpflags::overwrite_content | cpflags::overwrite_permissions);
    }
    catch (const system_error& e)
    {
      fail << "unable to move file " << from << " to " << to << ": " << e;
    }
  }
}
