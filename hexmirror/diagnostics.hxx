// file      : hexmirror/diagnostics.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef HEXMIRROR_DIAGNOSTICS_HXX
#define HEXMIRROR_DIAGNOSTICS_HXX

#include <libbutl/diagnostics.hxx>

#include <hexmirror/types.hxx>   // Note: not <hexmirror/utility.hxx>.

namespace hexmirror
{
  using butl::diag_record;

  // Throw this exception to terminate the process. The handler should
  // assume that the diagnostics has already been issued.
  //
  class failed: public std::exception
  {
  public:
    explicit
    failed (int c = 1): code (c) {}

    int code;
  };

  // Print process commmand line. If the number of elements is specified
  // (or the second version is used), then it will print the piped multi-
  // process command line, if present. In this case, the expected format
  // is as follows:
  //
  // name1 arg arg ... nullptr
  // name2 arg arg ... nullptr
  // ...
  // nameN arg arg ... nullptr nullptr
  //
  void
  print_process (diag_record&, const char* const args[], size_t n = 0);

  void
  print_process (const char* const args[], size_t n = 0);

  inline void
  print_process (diag_record& dr, const cstrings& args)
  {
    print_process (dr, args.data (), args.size ());
  }

  inline void
  print_process (const cstrings& args)
  {
    print_process (args.data (), args.size ());
  }

  // Verbosity level. Update documentation for --verbose if changing.
  //
  // 0 - disabled
  // 1 - high-level information messages
  // 2 - essential underlying commands that are being executed
  // 3 - all underlying commands that are being executed
  // 4 - information that could be helpful to the user
  // 5 - information that could be helpful to the developer
  // 6 - even more detailed information
  //
  // While uint8 is more than enough, use uint16 for the ease of printing.
  //
  extern uint16_t verb;

  template <typename F> inline void l1 (const F& f) {if (verb >= 1) f ();}
  template <typename F> inline void l2 (const F& f) {if (verb >= 2) f ();}
  template <typename F> inline void l3 (const F& f) {if (verb >= 3) f ();}
  template <typename F> inline void l4 (const F& f) {if (verb >= 4) f ();}
  template <typename F> inline void l5 (const F& f) {if (verb >= 5) f ();}
  template <typename F> inline void l6 (const F& f) {if (verb >= 6) f ();}

  // Diagnostic facility, base infrastructure.
  //
  using butl::diag_stream;
  using butl::diag_epilogue;

  // Diagnostic facility, project specifics.
  //
  struct simple_prologue_base
  {
    explicit
    simple_prologue_base (const char* type, const char* name)
        : type_ (type), name_ (name) {}

    void
    operator() (const diag_record& r) const;

  private:
    const char* type_;
    const char* name_;
  };

  class location
  {
  public:
    location () = default;

    location (string f, uint64_t l, uint64_t c)
        : file (std::move (f)), line (l), column (c) {}

    bool
    empty () const {return file.empty ();}

    string   file;
    uint64_t line = 0;
    uint64_t column = 0;
  };

  struct location_prologue_base
  {
    location_prologue_base (const char* type,
                            const char* name,
                            const location& l)
        : type_ (type), name_ (name), loc_ (l) {}

    void
    operator() (const diag_record& r) const;

  private:
    const char* type_;
    const char* name_;
    const location loc_;
  };

  struct basic_mark_base
  {
    using simple_prologue = butl::diag_prologue<simple_prologue_base>;
    using location_prologue = butl::diag_prologue<location_prologue_base>;

    explicit
    basic_mark_base (const char* type,
                     const char* indent = "\n  ",
                     const char* name = nullptr)
        : type_ (type), name_ (name), indent_ (indent) {}

    simple_prologue
    operator() () const
    {
      return simple_prologue (indent_, nullptr, type_, name_);
    }

    location_prologue
    operator() (const location& l) const
    {
      return location_prologue (indent_, nullptr, type_, name_, l);
    }

    template <typename F, typename L, typename C>
    location_prologue
    operator() (F&& f, L&& l, C&& c) const
    {
      return location_prologue (
        indent_,
        nullptr,
        type_,
        name_,
        location (std::forward<F> (f),
                  std::forward<L> (l),
                  std::forward<C> (c)));
    }

  protected:
    const char* type_;
    const char* name_;
    const char* indent_;
  };
  using basic_mark = butl::diag_mark<basic_mark_base>;

  extern const basic_mark error;
  extern const basic_mark warn;
  extern const basic_mark info;
  extern const basic_mark text;

  // trace
  //
  struct trace_mark_base: basic_mark_base
  {
    explicit
    trace_mark_base (const char* name)
        : basic_mark_base ("trace", nullptr /* indent */, name) {}
  };
  using trace_mark = butl::diag_mark<trace_mark_base>;
  using tracer = trace_mark;

  // fail
  //
  template <typename E>
  struct fail_mark_base: basic_mark_base
  {
    explicit
    fail_mark_base (const char* type)
        : basic_mark_base (type) {}

    simple_prologue
    operator() () const
    {
      return simple_prologue (indent_, &epilogue, type_, name_);
    }

    location_prologue
    operator() (const location& l) const
    {
      return location_prologue (indent_, &epilogue, type_, name_, l);
    }

    template <typename F, typename L, typename C>
    location_prologue
    operator() (F&& f, L&& l, C&& c) const
    {
      return location_prologue (
        indent_,
        &epilogue,
        type_,
        name_,
        location (std::forward<F> (f),
                  std::forward<L> (l),
                  std::forward<C> (c)));
    }

    static void
    epilogue (const diag_record& r, butl::diag_writer* w)
    {
      r.flush (w);
      throw E ();
    }
  };

  using fail_mark = butl::diag_mark<fail_mark_base<failed>>;

  struct fail_end_base
  {
    [[noreturn]] void
    operator() (const diag_record& r) const
    {
      // If we just throw then the record's destructor will see an active
      // exception and will not flush the record.
      //
      r.flush ();
      throw failed ();
    }
  };
  using fail_end = butl::diag_noreturn_end<fail_end_base>;

  extern const fail_mark fail;
  extern const fail_end endf;
}

#endif // HEXMIRROR_DIAGNOSTICS_HXX
