// file      : mod/mod-deploy.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mod/mod-deploy.hxx>

#include <cerrno>
#include <cstdlib>  // strtoull()
#include <sstream>
#include <iterator> // istreambuf_iterator

#include <libbutl/utility.hxx>    // getenv()
#include <libbutl/fdstream.hxx>
#include <libbutl/filesystem.hxx> // dir_exists()
#include <libbutl/json/parser.hxx>

#include <libstackhook/manifest.hxx>

#include <mod/hmac.hxx>
#include <mod/stack.hxx>
#include <mod/utility.hxx>

using namespace std;
using namespace butl;
using namespace stackhook::cli;

namespace stackhook
{
  deploy::
  deploy (const deploy& r)
      : handler (r),
        stack (r.stack),
        options_ (r.initialized_ ? r.options_ : nullptr),
        secret_ (r.secret_),
        settings_ (r.settings_),
        secrets_ (r.initialized_ ? r.secrets_ : nullptr)
  {
  }

  void deploy::
  init (scanner& s)
  {
    HANDLER_DIAG;

    options_ = make_shared<options::deploy> (
      s, unknown_mode::fail, unknown_mode::fail);

    // Return the environment variable value as an unsigned integer or
    // nullopt if the variable is not set.
    //
    auto env_number = [&fail] (const char* n) -> optional<size_t>
    {
      optional<string> v (butl::getenv (n));

      if (!v)
        return nullopt;

      const char* b (v->c_str ());
      char* e (nullptr);
      errno = 0; // We must clear it according to POSIX.
      unsigned long long r (strtoull (b, &e, 10)); // Can't throw.

      if (*b == '\0' || *b == '-' || *e != '\0' || errno == ERANGE)
        fail << "invalid " << n << " environment variable value '" << *v
             << "'";

      return static_cast<size_t> (r);
    };

    // Read the secret from the file, ignoring the leading and trailing
    // whitespaces.
    //
    auto read_secret = [&fail] (const path& p, const char* what)
    {
      if (p.relative ())
        fail << what << " path must be absolute";

      string r;

      try
      {
        ifdstream is (p);
        r = is.read_text ();
        is.close ();
      }
      catch (const io_error& e)
      {
        fail << "unable to read " << what << " from " << p << ": " << e;
      }

      if (trim (r).empty ())
        fail << "empty " << what << " in " << p;

      return r;
    };

    // Shared secret.
    //
    if (options_->deploy_secret_file_specified ())
    {
      secret_ = read_secret (options_->deploy_secret_file (),
                             "deploy-secret-file");
    }
    else
    {
      optional<string> v (butl::getenv ("DEPLOY_SECRET"));

      if (!v || v->empty ())
        fail << "deploy secret is not configured (neither "
             << "deploy-secret-file nor DEPLOY_SECRET is specified)";

      secret_ = move (*v);
    }

    // Stacks root.
    //
    if (!options_->deploy_stacks_root_specified ())
    {
      if (optional<string> v = butl::getenv ("STACKS_ROOT"))
      try
      {
        options_->deploy_stacks_root (dir_path (*v));
      }
      catch (const invalid_path&)
      {
        fail << "invalid STACKS_ROOT environment variable value '" << *v
             << "'";
      }
    }

    {
      const dir_path& d (options_->deploy_stacks_root ());

      if (d.empty () || d.relative ())
        fail << "stacks root '" << d << "' must be absolute";

      try
      {
        if (!dir_exists (d))
          fail << "stacks root " << d << " does not exist";
      }
      catch (const system_error& e)
      {
        fail << "unable to stat stacks root " << d << ": " << e;
      }
    }

    // Step timeouts.
    //
    auto timeout = [&env_number, &fail] (size_t v,
                                         bool specified,
                                         const char* var,
                                         const char* opt)
    {
      if (!specified)
      {
        if (optional<size_t> n = env_number (var))
          v = *n;
      }

      if (v == 0)
        fail << opt << " value must be positive";

      return v;
    };

    settings_.docker = options_->deploy_docker ();

    settings_.status_timeout =
      timeout (options_->deploy_status_timeout (),
               options_->deploy_status_timeout_specified (),
               "STATUS_TIMEOUT",
               "deploy-status-timeout");

    settings_.config_timeout =
      timeout (options_->deploy_config_timeout (),
               options_->deploy_config_timeout_specified (),
               "CONFIG_TIMEOUT",
               "deploy-config-timeout");

    settings_.pull_timeout =
      timeout (options_->deploy_pull_timeout (),
               options_->deploy_pull_timeout_specified (),
               "PULL_TIMEOUT",
               "deploy-pull-timeout");

    settings_.up_timeout =
      timeout (options_->deploy_up_timeout (),
               options_->deploy_up_timeout_specified (),
               "UP_TIMEOUT",
               "deploy-up-timeout");

    // Secrets store, if configured.
    //
    string addr (options_->vault_addr ());

    if (!options_->vault_addr_specified ())
    {
      if (optional<string> v = butl::getenv ("VAULT_ADDR"))
        addr = move (*v);
    }

    if (!addr.empty ())
    {
      vault_settings vs;
      vs.addr = move (addr);

      if (options_->vault_role_id_specified ())
        vs.role_id = options_->vault_role_id ();
      else if (optional<string> v = butl::getenv ("VAULT_ROLE_ID"))
        vs.role_id = move (*v);

      if (vs.role_id.empty ())
        fail << "vault role id is not configured (neither vault-role-id "
             << "nor VAULT_ROLE_ID is specified)";

      if (options_->vault_secret_id_file_specified ())
        vs.secret_id = read_secret (options_->vault_secret_id_file (),
                                    "vault-secret-id-file");
      else if (optional<string> v = butl::getenv ("VAULT_SECRET_ID"))
        vs.secret_id = move (*v);

      if (vs.secret_id.empty ())
        fail << "vault secret id is not configured (neither "
             << "vault-secret-id-file nor VAULT_SECRET_ID is specified)";

      vs.mount = options_->vault_mount ();

      if (vs.mount.empty ())
        fail << "vault-mount value is empty";

      vs.paths = options_->vault_path_specified ()
                 ? options_->vault_path ()
                 : strings ({"stacks/{stack}"});

      secrets_ = make_shared<vault_client> (move (vs));
    }
  }

  void deploy::
  reject (const deploy_failure& f) const
  {
    HANDLER_DIAG;

    l1 ([&]{trace << "request rejected (" << f.error << "): " << f.detail;});

    throw invalid_request (to_status (f.error), f.json (), "application/json");
  }

  bool deploy::
  handle (request& rq, response& rs)
  {
    HANDLER_DIAG;

    string signature;
    for (const name_value& h: rq.headers ())
    {
      if (icasecmp (h.name, "x-signature") == 0 && h.value)
        signature = *h.value;
    }

    // Read the entire request body since we need to verify its signature
    // before parsing it.
    //
    string body;
    {
      istream& is (rq.content (128 * 1024));

      try
      {
        body.assign (istreambuf_iterator<char> (is),
                     istreambuf_iterator<char> ());
      }
      catch (const io_error& e)
      {
        fail << "unable to read request body: " << e;
      }
    }

    // Verify the signature. If the stack is specified in the URL path and
    // the body is empty, then the stack name is signed instead.
    //
    {
      const string& m (stack && body.empty () ? *stack : body);

      optional<deploy_failure> f;

      try
      {
        f = verify_signature (*options_,
                              m.data (), m.size (),
                              secret_,
                              signature);
      }
      catch (const system_error& e)
      {
        fail << "unable to compute request HMAC: " << e;
      }

      if (f)
        reject (*f);
    }

    string sn; // Stack name.

    if (stack)
      sn = move (*stack);
    else
    {
      optional<string> s;

      // Note that the empty body is the same as the empty object.
      //
      if (!body.empty ())
      {
        try
        {
          istringstream is (body);
          json::parser p (is, "request body");

          s = move (deploy_request (p).stack);
        }
        catch (const json::invalid_json_input& e)
        {
          l1 ([&]{trace << "invalid request body: " << e;});

          reject (deploy_failure (deploy_error::bad_request,
                                  "invalid JSON payload"));
        }
        catch (const invalid_argument& e)
        {
          reject (deploy_failure (deploy_error::bad_request, e.what ()));
        }
      }

      if (!s)
        reject (deploy_failure (deploy_error::bad_request,
                                "stack is required"));

      sn = move (*s);
    }

    // Resolve the stack directory.
    //
    dir_path dir;
    try
    {
      const dir_path& root (options_->deploy_stacks_root ());
      checked<dir_path> d (stack_resolver (root).resolve (sn));

      if (!d)
      {
        const deploy_failure& f (d.failure ());

        if (f.error == deploy_error::internal_error)
          error << f.detail << ": " << root;

        reject (f);
      }

      dir = move (*d);
    }
    catch (const system_error& e)
    {
      fail << "unable to resolve stack " << sn << ": " << e;
    }

    strings env;
    try
    {
      env = docker_environment (dir);
    }
    catch (const system_error& e)
    {
      fail << "unable to query docker configuration for stack " << sn
           << ": " << e;
    }

    optional<string> docker_config;
    for (const string& v: env)
    {
      if (v.compare (0, 14, "DOCKER_CONFIG=") == 0)
        docker_config = string (v, 14);
    }

    if (secrets_ != nullptr)
      add_secrets (sn, dir, env);

    timestamp started (system_clock::now ());

    info << log_event ("deploy_start",
                       [&sn, &docker_config] (json::buffer_serializer& s)
                       {
                         s.member ("stack", sn);

                         s.member_name ("docker_config");
                         if (docker_config)
                           s.value (*docker_config);
                         else
                           s.value (nullptr);
                       });

    step_results ss (run_deploy (settings_,
                                 sn,
                                 dir,
                                 env,
                                 info,
                                 warn,
                                 verb_ >= 2 ? &trace : nullptr));

    deploy_response r (sn, move (ss), started, system_clock::now ());

    (r.ok ? info : warn) << log_event (
      "deploy_done",
      [&r] (json::buffer_serializer& s)
      {
        s.member ("stack", r.stack);
        s.member ("ok", r.ok);
      });

    rs.content (r.status (), "application/json") << r.json ();
    return true;
  }

  void deploy::
  add_secrets (const string& sn, const dir_path& dir, strings& env)
  {
    HANDLER_DIAG;

    path f (dir / "docker-compose.yml");

    set<string> vars;
    try
    {
      vars = compose_variables (f);
    }
    catch (const io_error& e)
    {
      fail << "unable to read " << f << ": " << e;
    }

    map<string, string> ss;
    try
    {
      ss = secrets_->fetch (sn);
    }
    catch (const runtime_error& e) // Includes system_error.
    {
      fail << "unable to fetch secrets for stack " << sn << ": " << e;
    }

    // Only pass the secrets referenced by the manifest.
    //
    size_t n (0);
    for (const auto& s: ss)
    {
      if (vars.find (s.first) != vars.end ())
      {
        env.push_back (s.first + '=' + s.second);
        ++n;
      }
    }

    info << log_event ("secrets",
                       [&sn, &ss, n] (json::buffer_serializer& s)
                       {
                         s.member ("stack", sn);
                         s.member ("fetched",
                                   static_cast<uint64_t> (ss.size ()));
                         s.member ("passed", static_cast<uint64_t> (n));
                       });
  }
}
