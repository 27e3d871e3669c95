// file      : mod/command.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mod/command.hxx>

#include <sys/time.h>   // timeval
#include <sys/select.h>

#include <ratio>        // ratio_greater_equal
#include <chrono>
#include <cstring>      // memchr()
#include <type_traits>  // static_assert

#include <libbutl/utility.hxx>  // icasecmp()
#include <libbutl/process.hxx>
#include <libbutl/fdstream.hxx>
#include <libbutl/process-io.hxx> // operator<<(ostream, process_args)

#include <mod/utility.hxx> // log_event()

using namespace std;
using namespace butl;

namespace stackhook
{
  static inline bool
  space (char c)
  {
    return c == ' '  || c == '\t' || c == '\r' ||
           c == '\n' || c == '\v' || c == '\f';
  }

  // Return true if the key, up to its first whitespace, contains one of the
  // sensitive words (case-insensitively).
  //
  static bool
  sensitive_key (const char* b, const char* e)
  {
    static const char* const words[] = {
      "secret", "token", "password", "passwd", "pwd", "key"};

    const char* w (b);
    for (; w != e && !space (*w); ++w) ;

    for (const char* p (b); p != w; ++p)
    {
      for (const char* s: words)
      {
        size_t n (strlen (s));

        if (static_cast<size_t> (w - p) >= n && icasecmp (s, p, n) == 0)
          return true;
      }
    }

    return false;
  }

  // Redact the line [b, e) (newline excluded) appending the result to r.
  //
  // The line is redacted if, after the indentation, it starts with a key
  // that contains a sensitive word, which is followed by the first `:` or
  // `=` and a non-blank value. The value, up to the first CR, is replaced
  // with the redaction marker and the trailing key whitespace is dropped.
  //
  static void
  sanitize_line (string& r, const char* b, const char* e)
  {
    const char* k (b);
    for (; k != e && space (*k); ++k) ;

    const char* d (k);
    for (; d != e && *d != ':' && *d != '='; ++d) ;

    if (d != e && sensitive_key (k, d))
    {
      // Find the value end (CR or line end) and make sure it is not blank.
      //
      const char* v (d + 1);
      const char* ve (v);
      for (; ve != e && *ve != '\r'; ++ve) ;

      for (; v != ve && space (*v); ++v) ;

      if (v != ve)
      {
        const char* ke (d);
        for (; ke != k && space (*(ke - 1)); --ke) ;

        r.append (b, ke - b);
        r += ": ***";
        r.append (ve, e - ve);
        return;
      }
    }

    r.append (b, e - b);
  }

  string
  sanitize (const string& s)
  {
    string r;
    r.reserve (s.size ());

    const char* p (s.c_str ());
    const char* pe (p + s.size ());

    while (p != pe)
    {
      const char* e (static_cast<const char*> (memchr (p, '\n', pe - p)));

      if (e == nullptr)
        e = pe;

      sanitize_line (r, p, e);

      if (e != pe)
      {
        r += '\n';
        ++e;
      }

      p = e;
    }

    return r;
  }

  string
  tail (const string& s, size_t n)
  {
    if (s.size () <= n)
      return s;

    size_t p (s.size () - n);

    // Skip the UTF-8 continuation bytes (10xxxxxx).
    //
    while (p != s.size () && (static_cast<unsigned char> (s[p]) & 0xC0) == 0x80)
      ++p;

    return string (s, p);
  }

  // Append the output chunk keeping at most twice the capture size and
  // trimming it to the most recent complete lines of the capture size once
  // exceeded. If the current line doesn't fit, then drop it entirely,
  // including its remainder that is yet to come.
  //
  static void
  capture (string& o, bool& dropping, const char* b, size_t n)
  {
    if (dropping)
    {
      const char* e (static_cast<const char*> (memchr (b, '\n', n)));

      if (e == nullptr)
        return;

      n -= e - b + 1;
      b = e + 1;
      dropping = false;
    }

    o.append (b, n);

    if (o.size () > 2 * step_capture_size)
    {
      size_t p (o.find ('\n', o.size () - step_capture_size));

      if (p == string::npos)
      {
        size_t l (o.rfind ('\n'));
        o.resize (l != string::npos ? l + 1 : 0);
        dropping = true;

        p = o.size () > step_capture_size
            ? o.find ('\n', o.size () - step_capture_size)
            : string::npos;
      }

      if (p != string::npos)
        o.erase (0, p + 1);
    }
  }

  step_result
  run_step (const string& stack,
            const string& name,
            const path& program,
            const strings& args,
            const dir_path& cwd,
            const strings& env,
            size_t tm,
            const basic_mark& info,
            const basic_mark& warn,
            const basic_mark* trace)
  {
    using namespace chrono;

    using time_point = system_clock::time_point;
    using duration   = system_clock::duration;

    // Make sure that the system clock has at least milliseconds resolution.
    //
    static_assert(
      ratio_greater_equal<milliseconds::period, duration::period>::value,
      "The system clock resolution is too low");

    assert (tm != 0);

    step_result r {name, false, nullopt, milliseconds::zero (), string ()};

    // The command line for diagnostics.
    //
    string cmd (program.string ());
    for (const string& a: args)
    {
      cmd += ' ';
      cmd += a;
    }

    const time_point started (system_clock::now ());

    // To make sure the command execution doesn't exceed the timeout we set
    // the non-blocking mode for the process output-reading stream, try to
    // read from it with the 10 milliseconds timeout and check the process
    // execution time between the reads. We then kill the process if the
    // execution time is exceeded.
    //
    milliseconds timeout (tm * 1000);
    bool timed_out (false);

    string out;
    bool dropping (false);

    // The reason the command couldn't be run to completion, if any. Note
    // that this is never the command output.
    //
    optional<string> err;

    try
    {
      fdpipe pipe (fdopen_pipe ()); // Can throw io_error.

      // Redirect both stdout and stderr to the pipe, so that we get the
      // output in the order it is produced.
      //
      process pr (
        process_start_callback ([trace] (const char* args[], size_t n)
                                {
                                  if (trace != nullptr)
                                    *trace << process_args {args, n};
                                },
                                -2              /* stdin (null device) */,
                                pipe            /* stdout */,
                                pipe.out.get () /* stderr */,
                                process_env (program, cwd, env),
                                args));
      pipe.out.close ();

      // Kill the process, if it is still running, and return true if it
      // was killed.
      //
      auto kill = [&pr] ()
      {
        pr.kill ();

        assert (pr.exit);
        return !pr.exit->normal ();
      };

      try
      {
        ifdstream is (move (pipe.in), fdstream_mode::non_blocking);

        const size_t nbuf (8192);
        char buf[nbuf];

        while (is.is_open ())
        {
          time_point start (system_clock::now ());

          // Max time to wait for the data portion.
          //
          milliseconds wd (min (timeout, milliseconds (10)));

          timeval tv {static_cast<time_t> (wd.count () / 1000),
                      static_cast<suseconds_t> (wd.count () % 1000 * 1000)};

          fd_set rd;
          FD_ZERO (&rd);
          FD_SET  (is.fd (), &rd);

          int n (select (is.fd () + 1, &rd, nullptr, nullptr, &tv));

          if (n == -1)
          {
            // Don't fail if the select() call was interrupted by the signal.
            //
            if (errno != EINTR)
              throw_system_ios_failure (errno, "select failed");
          }
          else if (n != 0) // Is data available?
          {
            assert (FD_ISSET (is.fd (), &rd));

            // The only legal way to read from non-blocking ifdstream.
            //
            streamsize n (is.readsome (buf, nbuf));

            // Close the stream (and bail out) if the end of the data is
            // reached. Otherwise capture the read data.
            //
            if (is.eof ())
              is.close ();
            else
            {
              assert (n != 0);
              capture (out, dropping, buf, static_cast<size_t> (n));
            }
          }
          else if (pr.try_wait ())
          {
            // The process has terminated but some of its children that have
            // inherited the output are still running (docker compose
            // plugins, etc). Assume we have read all the output.
            //
            is.close ();
          }

          // If the timeout is not exhausted, then decrement it and keep
          // reading. Otherwise, kill the process, if not done yet, and stop
          // reading. Note that it may happen that we are killing an already
          // terminated process, in which case kill() just sets the process
          // exit information. Also note that we stop reading even if the
          // process has terminated, since its children that have inherited
          // the output may keep writing to it indefinitely.
          //
          time_point now (system_clock::now ());

          // Assume we have waited the full amount if the time adjustment is
          // detected.
          //
          duration d (now > start ? now - start : wd);

          if (timeout > d)
            timeout -= duration_cast<milliseconds> (d);
          else
          {
            if (!pr.exit)
              timed_out = kill ();

            timeout = milliseconds::zero ();

            if (is.is_open ())
              is.close ();
          }
        }

        // Wait for the process termination for the remaining time and kill
        // it if it still hasn't terminated.
        //
        if (!pr.exit && !pr.timed_wait (timeout))
          timed_out = kill ();

        assert (pr.exit);

        if (!timed_out)
        {
          const process_exit& pe (*pr.exit);

          r.exit_code = pe.normal () ? pe.code () : -pe.signal ();
          r.ok = pe.normal () && pe.code () == 0;
        }
      }
      catch (const io_error& e)
      {
        if (!pr.exit)
          kill ();

        err = "unable to read " + cmd + " output: " + e.what ();
      }
    }
    // Handle process_error and io_error (both derive from system_error).
    //
    catch (const system_error& e)
    {
      err = "unable to execute " + cmd + ": " + e.what ();
    }

    {
      time_point now (system_clock::now ());
      r.duration = now > started
                   ? duration_cast<milliseconds> (now - started)
                   : milliseconds::zero ();
    }

    if (timed_out)
    {
      r.tail = "timeout after " + to_string (tm) + "s: command '" + cmd +
               "' timed out after " + to_string (tm) + " seconds";
    }
    else if (err)
    {
      r.tail = *err;
    }
    else
      r.tail = tail (sanitize (out));

    const basic_mark& m (r.ok ? info : warn);

    m << log_event (timed_out ? "step_timeout" : "step",
                    [&stack, &r, &err] (json::buffer_serializer& s)
                    {
                      s.member ("stack", stack);
                      s.member ("step", r.name);
                      s.member ("ok", r.ok);

                      s.member_name ("exit_code");
                      if (r.exit_code)
                        s.value (*r.exit_code);
                      else
                        s.value (nullptr);

                      s.member ("duration_ms",
                                static_cast<uint64_t> (r.duration.count ()));

                      if (err)
                        s.member ("error", *err);
                    });

    return r;
  }
}
