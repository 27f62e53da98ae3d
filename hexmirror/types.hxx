// file      : hexmirror/types.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef HEXMIRROR_TYPES_HXX
#define HEXMIRROR_TYPES_HXX

#include <set>
#include <vector>
#include <string>
#include <utility>       // pair
#include <cstddef>       // size_t, nullptr_t
#include <cstdint>       // uint{8,16,32,64}_t
#include <istream>
#include <ostream>
#include <functional>    // function

#include <ios>           // ios_base::failure
#include <exception>     // exception
#include <stdexcept>     // logic_error, invalid_argument, runtime_error
#include <system_error>

#include <mutex>
#include <atomic>
#include <thread>
#include <chrono>

#include <libbutl/path.hxx>
#include <libbutl/sha256.hxx>
#include <libbutl/process.hxx>
#include <libbutl/utility.hxx>         // operator<<(ostream, exception)
#include <libbutl/optional.hxx>
#include <libbutl/fdstream.hxx>

namespace hexmirror
{
  // Commonly-used types.
  //
  using std::uint8_t;
  using std::uint16_t;
  using std::uint32_t;
  using std::uint64_t;

  using std::size_t;
  using std::nullptr_t;

  using std::pair;
  using std::string;
  using std::function;

  using std::set;
  using std::vector;

  using strings = vector<string>;
  using cstrings = vector<const char*>;

  using std::istream;
  using std::ostream;

  // Exceptions. While <exception> is included, there is no using for
  // std::exception -- use qualified.
  //
  using std::logic_error;
  using std::invalid_argument;
  using std::runtime_error;
  using std::system_error;
  using io_error = std::ios_base::failure;

  // Concurrency.
  //
  using std::mutex;
  using std::thread;
  using std::atomic;
  using std::lock_guard;

  namespace chrono = std::chrono;

  // <libbutl/optional.hxx>
  //
  using butl::optional;
  using butl::nullopt;

  // <libbutl/path.hxx>
  //
  using butl::path;
  using butl::dir_path;
  using butl::invalid_path;

  using butl::path_cast;

  // <libbutl/sha256.hxx>
  //
  using butl::sha256;

  // <libbutl/process.hxx>
  //
  using butl::process;
  using butl::process_path;
  using butl::process_error;

  // <libbutl/fdstream.hxx>
  //
  using butl::ifdstream;
  using butl::ofdstream;
  using butl::fdopen_mode;
  using butl::fdstream_mode;
}

// In order to be found (via ADL) these have to be either in std:: or in
// butl::. The latter is bad idea since libbutl includes the default
// implementation.
//
namespace std
{
  // Custom path printing (canonicalized, with trailing slash for directories).
  //
  inline ostream&
  operator<< (ostream& os, const ::butl::path& p)
  {
    string r (p.representation ());
    ::butl::path::traits_type::canonicalize (r);
    return os << r;
  }
}

#endif // HEXMIRROR_TYPES_HXX
