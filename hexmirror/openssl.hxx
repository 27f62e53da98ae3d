// file      : hexmirror/openssl.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef HEXMIRROR_OPENSSL_HXX
#define HEXMIRROR_OPENSSL_HXX

#include <hexmirror/types.hxx>
#include <hexmirror/utility.hxx>

#include <hexmirror/hexmirror-options.hxx>

namespace hexmirror
{
  // Start the openssl process. Parameters in, out, err flags if the caller
  // wish to write to, or read from the process STDIN, STDOUT, STDERR streams.
  // If out and err are both true, then STDERR is redirected to STDOUT, and
  // they both can be read from in_ofd descriptor.
  //
  process
  start_openssl (const options&,
                 const char* command,
                 const cstrings& ops,
                 bool in = false,
                 bool out = false,
                 bool err = false);
}

#endif // HEXMIRROR_OPENSSL_HXX
