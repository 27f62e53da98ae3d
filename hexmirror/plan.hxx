// file      : hexmirror/plan.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef HEXMIRROR_PLAN_HXX
#define HEXMIRROR_PLAN_HXX

#include <hexmirror/types.hxx>
#include <hexmirror/utility.hxx>

#include <hexmirror/catalog.hxx>

namespace hexmirror
{
  // Fetch the remote file into the local file.
  //
  struct download_task
  {
    string url;
    path destination;
  };

  using download_tasks = vector<download_task>;

  // Mirror layout: the remote repository base URL and the local directory
  // which mirrors it.
  //
  class mirror_layout
  {
  public:
    // Note that the trailing slashes are stripped from the URL.
    //
    mirror_layout (dir_path root, string repo_url);

    const dir_path&
    root () const {return root_;}

    const string&
    repo_url () const {return repo_url_;}

    // Return the task for the file specified relative to the repository
    // root (for example, packages/foo).
    //
    download_task
    task (const string& file) const;

    path
    local (const string& file) const {return root_ / path (file);}

    // Repository files.
    //
    static string
    package_file (const package&);

    static string
    tarball_file (const package&, const release&);

  private:
    dir_path root_;
    string repo_url_;
  };

  // Return the tasks for the catalog files missing in the mirror. For each
  // package, these are the missing release tarballs and the package file if
  // it is missing or any of its tarballs are (in which case it is assumed
  // to be stale).
  //
  download_tasks
  plan_catalog_downloads (const packages&, const mirror_layout&);

  // Return the number of repository files described by the catalog (one per
  // package and one per release).
  //
  size_t
  catalog_file_count (const packages&);

  // Return the files that are fetched on every run: the repository index
  // and key files and the signatures of the specified manifests.
  //
  download_tasks
  auxiliary_downloads (const mirror_layout&, const strings& manifests);
}

#endif // HEXMIRROR_PLAN_HXX
