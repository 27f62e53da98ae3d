// file      : hexmirror/utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef HEXMIRROR_UTILITY_HXX
#define HEXMIRROR_UTILITY_HXX

#include <string>    // to_string()
#include <utility>   // move(), forward(), make_pair()
#include <cassert>   // assert()
#include <iterator>  // make_move_iterator()
#include <algorithm> // *

#include <libbutl/utility.hxx>         // icasecmp(), trim(), etc
#include <libbutl/filesystem.hxx>

#include <hexmirror/types.hxx>
#include <hexmirror/version.hxx>

namespace hexmirror
{
  using std::move;
  using std::forward;

  using std::make_pair;
  using std::make_move_iterator;
  using std::to_string;

  // <libbutl/utility.hxx>
  //
  using butl::icasecmp;

  using butl::trim;

  // <libbutl/filesystem.hxx>
  //
  using butl::auto_rmfile;
  using butl::auto_rmdir;

  // Path.
  //
  // Normalize a path. Also make the relative path absolute using the current
  // directory.
  //
  dir_path&
  normalize (dir_path&, const char* what);

  inline dir_path
  normalize (const dir_path& d, const char* what)
  {
    dir_path r (d);
    return move (normalize (r, what));
  }

  // Diagnostics.
  //
  // If stderr is not a terminal, then the value is absent (so can be used as
  // bool). Otherwise, it is the value of the TERM environment variable (which
  // can be NULL).
  //
  extern optional<const char*> stderr_term;

  // Filesystem.
  //
  bool
  exists (const path&, bool ignore_error = false);

  bool
  exists (const dir_path&, bool ignore_error = false);

  void
  mk_p (const dir_path&);

  // Move the file overwriting the destination, if exists. Should normally be
  // on the same filesystem for the move to be atomic.
  //
  void
  mv (const path& from, const path& to);
}

#endif // HEXMIRROR_UTILITY_HXX
