// file      : mod/vault.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mod/vault.hxx>

#include <libbutl/curl.hxx>
#include <libbutl/fdstream.hxx>
#include <libbutl/json/serializer.hxx>

using namespace std;
using namespace butl;

namespace stackhook
{
  [[noreturn]] static void
  throw_json (const json::parser& p, const string& m)
  {
    throw json::invalid_json_input (
      p.input_name,
      p.line (), p.column (), p.position (),
      m);
  }

  // Throw invalid_json_input when a required member `m` is missing from a
  // JSON object `o`.
  //
  [[noreturn]] static void
  missing_member (const json::parser& p, const char* o, const char* m)
  {
    throw_json (p, o + string (" object is missing member '") + m + '\'');
  }

  using event = json::event;

  // vault_auth
  //
  vault_auth::
  vault_auth (json::parser& p)
  {
    p.next_expect (event::begin_object);

    bool a (false);

    // Skip unknown/uninteresting members.
    //
    while (p.next_expect (event::name, event::end_object))
    {
      if (p.name () != "auth")
      {
        p.next_expect_value_skip ();
        continue;
      }

      a = true;

      p.next_expect (event::begin_object);

      bool ct (false), ld (false);

      while (p.next_expect (event::name, event::end_object))
      {
        auto c = [&p] (bool& v, const char* s)
        {
          return p.name () == s ? (v = true) : false;
        };

        if      (c (ct, "client_token")) client_token = p.next_expect_string ();
        else if (c (ld, "lease_duration"))
          lease_duration = p.next_expect_number<uint64_t> ();
        else p.next_expect_value_skip ();
      }

      if (!ct) missing_member (p, "vault_auth.auth", "client_token");
      if (!ld) missing_member (p, "vault_auth.auth", "lease_duration");
    }

    if (!a) missing_member (p, "vault_auth", "auth");
  }

  // vault_secret
  //
  vault_secret::
  vault_secret (json::parser& p)
  {
    p.next_expect (event::begin_object);

    bool d (false);

    while (p.next_expect (event::name, event::end_object))
    {
      if (p.name () != "data")
      {
        p.next_expect_value_skip ();
        continue;
      }

      d = true;

      p.next_expect (event::begin_object);

      bool dd (false);

      while (p.next_expect (event::name, event::end_object))
      {
        if (p.name () != "data")
        {
          p.next_expect_value_skip ();
          continue;
        }

        dd = true;

        p.next_expect (event::begin_object);

        while (p.next_expect (event::name, event::end_object))
        {
          string n (p.name ());
          data[move (n)] = p.next_expect_string ();
        }
      }

      if (!dd) missing_member (p, "vault_secret.data", "data");
    }

    if (!d) missing_member (p, "vault_secret", "data");
  }

  // Send the request to the Vault endpoint, parse the JSON response into rs
  // (only for 2XX codes), and return the HTTP status code. Send POST if the
  // body is specified and GET otherwise.
  //
  // Throw invalid_argument if unable to parse the response headers,
  // invalid_json_input (derived from invalid_argument) if unable to parse
  // the response body, and system_error in other cases.
  //
  template <typename T>
  static uint16_t
  vault_request (T& rs,
                 const string& url,
                 const strings& hdrs,
                 const string* body)
  {
    strings hdr_opts;

    for (const string& h: hdrs)
    {
      hdr_opts.push_back ("--header");
      hdr_opts.push_back (h);
    }

    try
    {
      // Pass --include to print the HTTP status line (followed by the
      // response headers) so that we can get the response status code.
      //
      // Suppress the --fail option which causes curl to exit with status 22
      // in case of an error HTTP response status code (>= 400) otherwise we
      // can't get the status code.
      //
      fdpipe errp (fdopen_pipe ()); // stderr pipe.

      optional<curl> c;

      if (body != nullptr)
        c.emplace (path ("-"), // Read input from curl::out.
                   path ("-"), // Write response to curl::in.
                   process::pipe (errp.in.get (), move (errp.out)),
                   curl::post,
                   curl::flags::no_fail,
                   url,
                   "--include",
                   "--header", "Content-Type: application/json",
                   move (hdr_opts));
      else
        c.emplace (nullfd,
                   path ("-"), // Write response to curl::in.
                   process::pipe (errp.in.get (), move (errp.out)),
                   curl::get,
                   curl::flags::no_fail,
                   url,
                   "--include",
                   move (hdr_opts));

      ifdstream err (move (errp.in));

      uint16_t sc; // Status code.
      try
      {
        // Note: re-open in/out so that they get automatically closed on
        // exception.
        //
        ifdstream in (c->in.release (), fdstream_mode::skip);

        if (body != nullptr)
        {
          ofdstream out (c->out.release ());
          out << *body;
          out.close ();
        }

        // Read the response status code and skip the headers. May throw
        // invalid_argument.
        //
        sc = curl::read_http_status (in).code;

        if (sc >= 200 && sc < 300)
        {
          json::parser p (in, url /* name */);
          rs = T (p);
        }

        in.close ();
      }
      catch (const io_error& e)
      {
        // If the process exits with non-zero status, assume the IO error is
        // due to that and fall through.
        //
        if (c->wait ())
        {
          throw_generic_error (
            e.code ().value (),
            (string ("unable to read curl stdout: ") + e.what ()).c_str ());
        }
      }
      catch (const invalid_argument&)
      {
        // If the process exits with non-zero status, assume the status line
        // or JSON error is due to that (connection refused, etc) and fall
        // through.
        //
        if (c->wait ())
          throw;
      }

      if (!c->wait ())
      {
        string et (err.read_text ());
        throw_generic_error (EINVAL,
                             ("non-zero curl exit status: " + et).c_str ());
      }

      err.close ();

      return sc;
    }
    catch (const process_error& e)
    {
      throw_generic_error (
        e.code ().value (),
        (string ("unable to execute curl: ") + e.what ()).c_str ());
    }
    catch (const io_error& e)
    {
      // Unable to read diagnostics from stderr.
      //
      throw_generic_error (
        e.code ().value (),
        (string ("unable to read curl stderr: ") + e.what ()).c_str ());
    }
  }

  // vault_client
  //
  vault_client::
  vault_client (vault_settings s)
      : settings_ (move (s)), token_expiration_ (timestamp_nonexistent)
  {
    while (!settings_.addr.empty () && settings_.addr.back () == '/')
      settings_.addr.pop_back ();
  }

  string vault_client::
  secret_path (const string& p, const string& stack)
  {
    static const string ph ("{stack}");

    string r (p);
    for (size_t i (0); (i = r.find (ph, i)) != string::npos; i += stack.size ())
      r.replace (i, ph.size (), stack);

    return r;
  }

  const string& vault_client::
  token ()
  {
    timestamp now (system_clock::now ());

    if (token_ && now < token_expiration_)
      return *token_;

    token_ = nullopt;

    string b;
    {
      json::buffer_serializer s (b, 0 /* indentation */);

      s.begin_object ();
      s.member ("role_id", settings_.role_id);
      s.member ("secret_id", settings_.secret_id);
      s.end_object ();
    }

    vault_auth a;
    uint16_t sc;

    try
    {
      sc = vault_request (a,
                          settings_.addr + "/v1/auth/approle/login",
                          strings () /* headers */,
                          &b);
    }
    catch (const invalid_argument& e)
    {
      throw runtime_error (string ("invalid vault login response: ") +
                           e.what ());
    }

    if (sc != 200)
      throw runtime_error ("vault login failed with status " +
                           to_string (sc));

    // Renew the token a minute before its lease expires. Note that the zero
    // lease duration means the token never expires.
    //
    using std::chrono::seconds;

    if (a.lease_duration == 0)
      token_expiration_ = timestamp::max ();
    else if (a.lease_duration > 60)
      token_expiration_ = now + seconds (a.lease_duration - 60);
    else
      token_expiration_ = now;

    token_ = move (a.client_token);
    return *token_;
  }

  // Thrown if the token is rejected by Vault (revoked, etc).
  //
  struct access_denied: runtime_error
  {
    using runtime_error::runtime_error;
  };

  // Read and merge the stack secrets from the configured paths.
  //
  static map<string, string>
  read_secrets (const vault_settings& vs,
                const string& stack,
                const string& token)
  {
    map<string, string> r;

    strings hdrs {"X-Vault-Token: " + token};

    for (const string& p: vs.paths)
    {
      string sp (vault_client::secret_path (p, stack));
      string url (vs.addr + "/v1/" + vs.mount + "/data/" + sp);

      vault_secret s;
      uint16_t sc;

      try
      {
        sc = vault_request (s, url, hdrs, nullptr /* body */);
      }
      catch (const invalid_argument& e)
      {
        throw runtime_error ("invalid vault response for " + sp + ": " +
                             e.what ());
      }

      if (sc == 404)
        continue;

      if (sc == 401 || sc == 403)
        throw access_denied ("unable to read vault secret " + sp +
                             ": access denied (status " + to_string (sc) +
                             ')');

      if (sc != 200)
        throw runtime_error ("unable to read vault secret " + sp +
                             ": status " + to_string (sc));

      for (auto& v: s.data)
        r[v.first] = move (v.second);
    }

    return r;
  }

  map<string, string> vault_client::
  fetch (const string& stack)
  {
    lock_guard<mutex> l (mutex_);

    bool cached (token_ && system_clock::now () < token_expiration_);

    try
    {
      return read_secrets (settings_, stack, token ());
    }
    catch (const access_denied&)
    {
      if (!cached)
        throw;
    }

    // The cached token has been rejected. Log in again and retry once.
    //
    token_ = nullopt;
    return read_secrets (settings_, stack, token ());
  }
}
