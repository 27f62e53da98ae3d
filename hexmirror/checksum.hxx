// file      : hexmirror/checksum.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef HEXMIRROR_CHECKSUM_HXX
#define HEXMIRROR_CHECKSUM_HXX

#include <hexmirror/types.hxx>
#include <hexmirror/utility.hxx>

#include <hexmirror/hexmirror-options.hxx>

namespace hexmirror
{
  // Calculate SHA256 sum of the specified memory buffer in binary mode.
  //
  inline string
  sha256sum (const char* buf, size_t n) {return sha256 (buf, n).string ();}

  // The same but for a file. Throw io_error if the file cannot be read.
  //
  string
  sha256sum (const path& file);

  // Calculate SHA512 sum of a file by running the openssl program. Return
  // nullopt if openssl was unable to read the file (in which case it has
  // issued diagnostics). Issue diagnostics and throw failed if the program
  // cannot be executed or its output is not recognized.
  //
  optional<string>
  sha512sum (const options&, const path& file);

  // Return true if the file exists, can be read, and its checksum matches
  // the specified hex digest (compared case-insensitively). The checksum
  // algorithm is deduced from the digest length: 64 digits for SHA256 and
  // 128 digits for SHA512. A digest of any other length never matches.
  //
  // Note that the file absence is not an error.
  //
  bool
  verify_checksum (const options&, const path& file, const string& digest);
}

#endif // HEXMIRROR_CHECKSUM_HXX
