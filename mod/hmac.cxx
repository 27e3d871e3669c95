// file      : mod/hmac.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mod/hmac.hxx>

#include <cctype> // tolower()

#include <libbutl/openssl.hxx>

using namespace std;
using namespace butl;

namespace stackhook
{
  string
  compute_hmac (const options::openssl_options& o,
                const void* m, size_t l,
                const string& k)
  {
    try
    {
      fdpipe errp (fdopen_pipe ()); // stderr pipe.

      // To compute an HMAC over stdin with the key <secret>:
      //
      //   openssl dgst -sha256 -hmac <secret>
      //
      // Request the output in the coreutils format (-r option) since the
      // default format differs between openssl versions:
      //
      // 5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843 *stdin
      //
      // Note that here we assume both output and diagnostics will fit into
      // pipe buffers and don't poll both with fdselect().
      //
      openssl os (path ("-"), // Read message from openssl::out.
                  path ("-"), // Write output to openssl::in.
                  process::pipe (errp.in.get (), move (errp.out)),
                  process_env (o.openssl (), o.openssl_envvar ()),
                  "dgst", o.openssl_option (),
                  "-sha256",
                  "-hmac", k,
                  "-r");

      ifdstream err (move (errp.in));

      string h; // The HMAC value.
      try
      {
        // In case of an exception, skip and close input after output.
        //
        // Note: re-open in/out so that they get automatically closed on an
        // exception.
        //
        ifdstream in (os.in.release (), fdstream_mode::skip);
        ofdstream out (os.out.release ());

        out.write (static_cast<const char*> (m), l);
        out.close ();

        getline (in, h);
        in.close ();
      }
      catch (const io_error& e)
      {
        // If the process exits with non-zero status, assume the IO error is
        // due to that and fall through.
        //
        if (os.wait ())
        {
          throw_generic_error (
            e.code ().value (),
            (string ("unable to read/write openssl stdout/stdin: ") +
             e.what ()).c_str ());
        }
      }

      if (!os.wait ())
      {
        string et (err.read_text ());
        throw_generic_error (EINVAL,
                             ("non-zero openssl exit status: " + et).c_str ());
      }

      err.close ();

      // Verify the openssl output string and strip the ' *stdin' suffix.
      //
      if (h.find (' ') != 64)
        throw_generic_error (EINVAL, "unable to parse openssl stdout");

      h.resize (64);

      return h;
    }
    catch (const process_error& e)
    {
      throw_generic_error (
        e.code ().value (),
        (string ("unable to execute openssl: ") + e.what ()).c_str ());
    }
    catch (const io_error& e)
    {
      // Unable to read diagnostics from stderr.
      //
      throw_generic_error (
        e.code ().value (),
        (string ("unable to read openssl stderr: ") + e.what ()).c_str ());
    }
  }

  bool
  constant_time_equal (const string& x, const string& y)
  {
    if (x.size () != y.size ())
      return false;

    unsigned char r (0);
    for (size_t i (0); i != x.size (); ++i)
      r |= static_cast<unsigned char> (x[i] ^ y[i]);

    return r == 0;
  }

  optional<deploy_failure>
  verify_signature (const options::openssl_options& o,
                    const void* m, size_t l,
                    const string& secret,
                    const string& signature)
  {
    string s (signature);
    trim (s);

    if (s.empty ())
      return deploy_failure (deploy_error::unauthorized, "missing signature");

    for (char& c: s)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    string h (compute_hmac (o, m, l, secret));

    if (!constant_time_equal (h, s))
      return deploy_failure (deploy_error::unauthorized, "invalid signature");

    return nullopt;
  }
}
