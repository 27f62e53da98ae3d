// file      : hexmirror/fetch.test.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef HEXMIRROR_FETCH_TEST_HXX
#define HEXMIRROR_FETCH_TEST_HXX

#include <hexmirror/fetch.hxx>

#include <map>
#include <sstream>
#include <streambuf>

#include <libbutl/filesystem.hxx> // path_entry(), try_rmfile()

#include <hexmirror/types.hxx>
#include <hexmirror/utility.hxx>

#include <hexmirror/diagnostics.hxx>

namespace hexmirror
{
  // In-memory HTTP transport. Serves the scripted responses and records the
  // requests.
  //
  class fake_client: public http_client
  {
  public:
    struct response
    {
      uint16_t status;
      string body;

      // If true, then the transfer is interrupted after the body is read.
      //
      bool interrupted = false;

      // If present, then called right before the body is handed over.
      //
      function<void ()> reading = nullptr;
    };

    // Add the response for the URL. The responses for the same URL are
    // served in order with the last one repeated indefinitely. Requests for
    // an unknown URL are responded with 404.
    //
    void
    add (const string& url, uint16_t status, string body = string ())
    {
      add (url, response {status, move (body), false});
    }

    void
    add (const string& url, response r)
    {
      lock_guard<mutex> l (mutex_);
      responses_[url].push_back (move (r));
    }

    virtual uint16_t
    get (const string& url, const function<void (istream&)>& body) override
    {
      response r;
      {
        lock_guard<mutex> l (mutex_);

        log_.push_back (url);

        auto i (responses_.find (url));
        if (i == responses_.end ())
          return 404;

        size_t& n (served_[url]);
        const vector<response>& rs (i->second);

        r = rs[n < rs.size () ? n : rs.size () - 1];
        ++n;
      }

      if (!http_success (r.status))
        return r.status;

      if (r.reading)
        r.reading ();

      try
      {
        if (r.interrupted)
        {
          interrupted_buffer b (r.body);
          istream is (&b);
          is.exceptions (istream::badbit);
          body (is);
        }
        else
        {
          std::istringstream is (r.body);
          is.exceptions (istream::badbit);
          body (is);
        }
      }
      catch (const io_error& e)
      {
        fail << "unable to read fetched " << url << ": " << e;
      }

      return r.status;
    }

    strings
    requests () const
    {
      lock_guard<mutex> l (mutex_);
      return log_;
    }

    size_t
    requests (const string& url) const
    {
      lock_guard<mutex> l (mutex_);
      return static_cast<size_t> (
        std::count (log_.begin (), log_.end (), url));
    }

  private:
    // Serve the data and then fail as if the connection was reset.
    //
    class interrupted_buffer: public std::streambuf
    {
    public:
      explicit
      interrupted_buffer (string d)
          : data_ (move (d))
      {
        char* b (&data_[0]);
        setg (b, b, b + data_.size ());
      }

    protected:
      virtual int_type
      underflow () override
      {
        throw io_error ("connection reset by peer");
      }

    private:
      string data_;
    };

  private:
    mutable mutex mutex_;
    std::map<string, vector<response>> responses_;
    std::map<string, size_t> served_;
    strings log_;
  };

  // Test filesystem helpers.
  //
  inline void
  write_file (const path& f, const string& s)
  {
    ofdstream os (f, fdopen_mode::out      |
                     fdopen_mode::create   |
                     fdopen_mode::truncate |
                     fdopen_mode::binary);
    os << s;
    os.close ();
  }

  inline string
  read_file (const path& f)
  {
    ifdstream is (f, fdopen_mode::binary);
    string r (is.read_text ());
    is.close ();
    return r;
  }

  // Create a unique temporary directory that is removed on destruction.
  //
  inline auto_rmdir
  make_temp_dir (const string& name)
  {
    dir_path d (dir_path::temp_path ("hexmirror-" + name));
    mk_p (d);
    return auto_rmdir (move (d));
  }
}

#endif // HEXMIRROR_FETCH_TEST_HXX
