// file      : hexmirror/fetch.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef HEXMIRROR_FETCH_HXX
#define HEXMIRROR_FETCH_HXX

#include <hexmirror/types.hxx>
#include <hexmirror/utility.hxx>

#include <hexmirror/hexmirror-options.hxx>

namespace hexmirror
{
  // HTTP(S) transport.
  //
  // Implementations must be usable from multiple threads simultaneously
  // (the catalog pages and the files are fetched by worker pools).
  //
  class http_client
  {
  public:
    virtual
    ~http_client ();

    // Issue the GET request for the specified URL and return the response
    // status code. If the status code is 2xx, then call the body function
    // passing the stream to read the response body from. Otherwise, drop
    // the response body without calling the function.
    //
    // Issue diagnostics and throw failed if the request could not be
    // performed or the transfer was interrupted. Note that in the latter
    // case the body function may have only seen a part of the body.
    //
    virtual uint16_t
    get (const string& url, const function<void (istream&)>& body) = 0;
  };

  inline bool
  http_success (uint16_t sc)
  {
    return sc >= 200 && sc < 300;
  }

  // Fetch the URL, returning the status code and the response body (empty
  // if the status is not 2xx).
  //
  pair<uint16_t, string>
  fetch_text (http_client&, const string& url);

  // Fetch resources by running the curl program.
  //
  // Note that unlike wget and fetch, curl provides an easy way to retrieve
  // the HTTP status code (which we need to recognize the rate limiting
  // responses) and so it is the only fetch program supported.
  //
  class curl_client: public http_client
  {
  public:
    explicit
    curl_client (const options& o): ops_ (o) {}

    virtual uint16_t
    get (const string& url, const function<void (istream&)>& body) override;

  private:
    process
    start (const string& url);

  private:
    const options& ops_;
  };
}

#endif // HEXMIRROR_FETCH_HXX
