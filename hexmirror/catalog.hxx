// file      : hexmirror/catalog.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef HEXMIRROR_CATALOG_HXX
#define HEXMIRROR_CATALOG_HXX

#include <hexmirror/types.hxx>
#include <hexmirror/utility.hxx>

#include <hexmirror/fetch.hxx>
#include <hexmirror/hexmirror-options.hxx>

namespace hexmirror
{
  // Package catalog, as served by the repository API.
  //
  struct release
  {
    string version;
  };

  struct package
  {
    string name;
    vector<release> releases;
  };

  using packages = vector<package>;

  // Parse the catalog JSON array of package objects. The name is used to
  // identify the input in diagnostics. Empty input and JSON null are treated
  // as an empty catalog.
  //
  // Issue diagnostics and throw failed if the input is not valid JSON or a
  // package or release object is malformed. Unknown members are ignored.
  //
  packages
  parse_catalog (istream&, const string& name);

  packages
  parse_catalog (const string& text, const string& name);

  // Return the URL of the catalog page.
  //
  string
  catalog_page_url (const string& catalog_url, uint64_t page);

  // Called while the API is rate limiting the requests. If empty, then
  // sleep for the --rate-limit-pause seconds.
  //
  using pause_function = function<void ()>;

  // Fetch the catalog page (numbered starting from 1). Retry the request
  // indefinitely while the API responds with the 429 (Too Many Requests)
  // status. Issue diagnostics and throw failed on any other non-2xx status.
  //
  packages
  fetch_catalog_page (http_client&,
                      const options&,
                      uint64_t page,
                      const pause_function& = {});

  // Fetch the complete catalog, page by page, until the first empty page.
  //
  // The pages are fetched in batches of --catalog-jobs pages concurrently.
  // The packages are returned in the page order. If a batch contains an
  // empty page, then the pages of this batch that follow it are discarded,
  // failures to fetch them including. The rate limited requests for such
  // pages are not retried once the empty page is fetched.
  //
  packages
  fetch_catalog (http_client&, const options&, const pause_function& = {});

  // Load/save the catalog from/to a file in the same JSON format as served
  // by the API.
  //
  packages
  load_catalog (const path&);

  void
  save_catalog (const packages&, const path&);
}

#endif // HEXMIRROR_CATALOG_HXX
