// file      : tests/vault/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <stdlib.h> // setenv()

#include <sstream>
#include <iostream>

#include <libbutl/utility.hxx>    // operator<<(ostream,exception), getenv()
#include <libbutl/fdstream.hxx>
#include <libbutl/filesystem.hxx>
#include <libbutl/json/parser.hxx>

#include <libstackhook/types.hxx>
#include <libstackhook/utility.hxx>

#include <mod/vault.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace butl;
using namespace stackhook;

template <typename T>
static T
parse (const string& s)
{
  istringstream is (s);
  json::parser p (is, "response");
  return T (p);
}

template <typename T>
static bool
invalid (const string& s)
{
  try
  {
    parse<T> (s);
    return false;
  }
  catch (const json::invalid_json_input&)
  {
    return true;
  }
}

static void
write_file (const path& f, const string& s)
{
  ofdstream os (f);
  os << s;
  os.close ();
}

static string
read_file (const path& f)
{
  ifdstream is (f);
  string r (is.read_text ());
  is.close ();
  return r;
}

// Return the number of logins performed by the fake Vault server.
//
static size_t
logins (const dir_path& d)
{
  return file_exists (d / "logins")
         ? static_cast<size_t> (stoul (read_file (d / "logins")))
         : 0;
}

static bool
fetch_fails (vault_client& c, const string& stack, const string& what)
{
  try
  {
    c.fetch (stack);
    return false;
  }
  catch (const runtime_error& e)
  {
    return string (e.what ()).find (what) != string::npos;
  }
}

int
main ()
try
{
  // Login response.
  //
  {
    vault_auth a (parse<vault_auth> (
      "{"
      "  \"request_id\": \"7c1a\","
      "  \"data\": null,"
      "  \"auth\": {"
      "    \"client_token\": \"hvs.CAESI\","
      "    \"accessor\": \"0e9e\","
      "    \"policies\": [\"default\", \"deploy\"],"
      "    \"metadata\": {\"role_name\": \"deploy\"},"
      "    \"lease_duration\": 3600,"
      "    \"renewable\": true"
      "  }"
      "}"));

    assert (a.client_token == "hvs.CAESI");
    assert (a.lease_duration == 3600);

    assert (invalid<vault_auth> ("{}"));
    assert (invalid<vault_auth> ("{\"auth\": {\"lease_duration\": 0}}"));
    assert (invalid<vault_auth> ("{\"auth\": {\"client_token\": \"t\"}}"));
    assert (invalid<vault_auth> ("{\"auth\": {\"client_token\": 1,"
                                 "\"lease_duration\": 0}}"));
    assert (invalid<vault_auth> ("[]"));
  }

  // Secret response.
  //
  {
    vault_secret s (parse<vault_secret> (
      "{"
      "  \"data\": {"
      "    \"data\": {\"DB_PASSWORD\": \"hunter2\", \"API_KEY\": \"abc\"},"
      "    \"metadata\": {\"version\": 3, \"destroyed\": false}"
      "  },"
      "  \"lease_duration\": 0"
      "}"));

    assert (s.data.size () == 2);
    assert (s.data["DB_PASSWORD"] == "hunter2");
    assert (s.data["API_KEY"] == "abc");

    vault_secret e (parse<vault_secret> ("{\"data\": {\"data\": {}}}"));
    assert (e.data.empty ());

    assert (invalid<vault_secret> ("{\"errors\": []}"));
    assert (invalid<vault_secret> ("{\"data\": {\"metadata\": {}}}"));
    assert (invalid<vault_secret> ("{\"data\": {\"data\": {\"N\": 1}}}"));
  }

  // Secret paths.
  //
  {
    assert (vault_client::secret_path ("stacks/{stack}", "web") ==
            "stacks/web");
    assert (vault_client::secret_path ("{stack}/{stack}", "db") == "db/db");
    assert (vault_client::secret_path ("shared/registry", "web") ==
            "shared/registry");
  }

  // Client. The fake curl executable found first in PATH answers the login
  // and secret read requests from the files in the state directory:
  //
  // lease            login lease duration
  // logins           number of logins performed (tokens are t1, t2, ...)
  // login-fail       fail the login with 400
  // fail             fail the secret reads with 500
  // revoked-<token>  reject the secret reads with the token with 403
  // secrets/<path>   secret read response for the path
  //
  dir_path tmp (dir_path::temp_path ("stackhook-vault"));
  try_mkdir_p (tmp / dir_path ("bin"));
  try_mkdir_p (tmp / dir_path ("secrets") / dir_path ("stacks"));
  auto_rmdir rm (tmp);

  const string d (tmp.string ());

  path curl (tmp / dir_path ("bin") / "curl");
  write_file (
    curl,
    "#!/bin/sh\n"
    "d='" + d + "'\n"
    "url=\n"
    "tok=\n"
    "for a in \"$@\"; do\n"
    "  case \"$a\" in\n"
    "    http://*)        url=\"$a\" ;;\n"
    "    X-Vault-Token:*) tok=\"${a#X-Vault-Token: }\" ;;\n"
    "  esac\n"
    "done\n"
    "cat >/dev/null\n"
    "echo \"$url $tok\" >>\"$d/calls\"\n"
    "case \"$url\" in\n"
    "  */v1/auth/approle/login)\n"
    "    if [ -f \"$d/login-fail\" ]; then\n"
    "      printf 'HTTP/1.1 400 Bad Request\\r\\n\\r\\n{\"errors\":[]}'\n"
    "      exit 0\n"
    "    fi\n"
    "    n=$(cat \"$d/logins\" 2>/dev/null || echo 0)\n"
    "    n=$((n+1))\n"
    "    echo $n >\"$d/logins\"\n"
    "    printf 'HTTP/1.1 200 OK\\r\\n\\r\\n'\n"
    "    printf '{\"auth\":{\"client_token\":\"t%s\",' $n\n"
    "    printf '\"lease_duration\":%s}}' $(cat \"$d/lease\")\n"
    "    ;;\n"
    "  */v1/secret/data/*)\n"
    "    p=\"${url#*/v1/secret/data/}\"\n"
    "    if [ -f \"$d/fail\" ]; then\n"
    "      printf 'HTTP/1.1 500 Internal Server Error\\r\\n\\r\\n{}'\n"
    "    elif [ -f \"$d/revoked-$tok\" ]; then\n"
    "      printf 'HTTP/1.1 403 Forbidden\\r\\n\\r\\n{\"errors\":[]}'\n"
    "    elif [ -f \"$d/secrets/$p\" ]; then\n"
    "      printf 'HTTP/1.1 200 OK\\r\\n\\r\\n'\n"
    "      cat \"$d/secrets/$p\"\n"
    "    else\n"
    "      printf 'HTTP/1.1 404 Not Found\\r\\n\\r\\n{\"errors\":[]}'\n"
    "    fi\n"
    "    ;;\n"
    "esac\n");
  path_permissions (curl,
                    permissions::ru | permissions::wu | permissions::xu);

  {
    optional<string> p (butl::getenv ("PATH"));
    string v ((tmp / dir_path ("bin")).string ());

    if (p)
      v += ':' + *p;

    setenv ("PATH", v.c_str (), 1 /* overwrite */);
  }

  write_file (tmp / dir_path ("secrets") / "shared",
              "{\"data\": {\"data\": {\"REGISTRY\": \"r1\","
              " \"DB_PASSWORD\": \"shared\"}}}");

  write_file (tmp / dir_path ("secrets") / dir_path ("stacks") / "web",
              "{\"data\": {\"data\": {\"DB_PASSWORD\": \"hunter2\"}}}");

  vault_settings vs {"http://vault.test/",
                     "role",
                     "secret",
                     "secret",
                     strings {"shared", "stacks/{stack}"}};

  // The token is cached for the lease duration and the later paths override
  // the earlier ones while the missing paths are skipped.
  //
  {
    write_file (tmp / "lease", "3600");

    vault_client c (vs);

    map<string, string> w (c.fetch ("web"));
    assert (w.size () == 2);
    assert (w["REGISTRY"] == "r1");
    assert (w["DB_PASSWORD"] == "hunter2");

    map<string, string> b (c.fetch ("db"));
    assert (b.size () == 2);
    assert (b["DB_PASSWORD"] == "shared");

    assert (logins (tmp) == 1);

    string cs (read_file (tmp / "calls"));
    assert (cs.find ("http://vault.test/v1/auth/approle/login \n") == 0);
    assert (cs.find ("http://vault.test/v1/secret/data/stacks/web t1\n") !=
            string::npos);

    // The cached token is revoked: log in again and retry.
    //
    write_file (tmp / "revoked-t1", "");

    map<string, string> r (c.fetch ("web"));
    assert (r["DB_PASSWORD"] == "hunter2");
    assert (logins (tmp) == 2);

    // Server error is not retried.
    //
    write_file (tmp / "fail", "");
    assert (fetch_fails (c, "web", "status 500"));
    assert (logins (tmp) == 2);
    try_rmfile (tmp / "fail");
  }

  // A freshly obtained token which is rejected is not retried. Neither is
  // the cached token rejected again after the re-login.
  //
  {
    write_file (tmp / "revoked-t3", "");
    write_file (tmp / "revoked-t4", "");

    vault_client c (vs);

    assert (fetch_fails (c, "web", "access denied (status 403)"));
    assert (logins (tmp) == 3);

    assert (fetch_fails (c, "web", "access denied (status 403)"));
    assert (logins (tmp) == 4);
  }

  // The token about to expire is renewed on every fetch.
  //
  {
    write_file (tmp / "lease", "30");

    vault_client c (vs);

    c.fetch ("web");
    c.fetch ("web");
    assert (logins (tmp) == 6);
  }

  // Login failure.
  //
  {
    write_file (tmp / "login-fail", "");

    vault_client c (vs);
    assert (fetch_fails (c, "web", "vault login failed with status 400"));
  }

  return 0;
}
catch (const std::exception& e)
{
  cerr << e << endl;
  return 1;
}
