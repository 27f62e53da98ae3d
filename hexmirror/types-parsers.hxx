// file      : hexmirror/types-parsers.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

// CLI parsers, included into the generated source files.
//

#ifndef HEXMIRROR_TYPES_PARSERS_HXX
#define HEXMIRROR_TYPES_PARSERS_HXX

#include <hexmirror/types.hxx>

#include <hexmirror/hexmirror-options.hxx> // hexmirror::cli namespace

namespace hexmirror
{
  namespace cli
  {
    template <>
    struct parser<path>
    {
      static void
      parse (path&, bool&, scanner&);

      static void
      merge (path& b, const path& a) {b = a;}
    };

    template <>
    struct parser<dir_path>
    {
      static void
      parse (dir_path&, bool&, scanner&);

      static void
      merge (dir_path& b, const dir_path& a) {b = a;}
    };
  }
}

#endif // HEXMIRROR_TYPES_PARSERS_HXX
