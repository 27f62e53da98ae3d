// file      : hexmirror/download.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef HEXMIRROR_DOWNLOAD_HXX
#define HEXMIRROR_DOWNLOAD_HXX

#include <hexmirror/types.hxx>
#include <hexmirror/utility.hxx>

#include <hexmirror/plan.hxx>
#include <hexmirror/fetch.hxx>

namespace hexmirror
{
  enum class download_status
  {
    fetched,
    failed,
    skipped
  };

  string
  to_string (download_status);

  inline ostream&
  operator<< (ostream& os, download_status s) {return os << to_string (s);}

  using download_results = vector<download_status>;

  struct download_summary
  {
    size_t fetched = 0;
    size_t failed = 0;
    size_t skipped = 0;
  };

  download_summary
  summarize (const download_results&);

  // Fetch a single file, overwriting the destination if it exists. Skip the
  // task if its URL or destination is empty. The destination directory
  // must exist.
  //
  // If the file cannot be fetched, then issue diagnostics and return the
  // failed status. In this case the destination file is removed if it has
  // been (partially) written and left untouched otherwise.
  //
  download_status
  download_file (http_client&, const download_task&);

  // Create the destination directories and then fetch the files using the
  // specified number of worker threads. Return the status of each task, in
  // the task order.
  //
  download_results
  execute_downloads (http_client&, const download_tasks&, size_t jobs);
}

#endif // HEXMIRROR_DOWNLOAD_HXX
