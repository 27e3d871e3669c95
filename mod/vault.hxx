// file      : mod/vault.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MOD_VAULT_HXX
#define MOD_VAULT_HXX

#include <mutex>

#include <libbutl/json/parser.hxx>

#include <libstackhook/types.hxx>
#include <libstackhook/utility.hxx>

namespace stackhook
{
  namespace json = butl::json;

  // Stack secrets storage.
  //
  class secret_store
  {
  public:
    virtual
    ~secret_store () = default;

    // Return the stack secrets as a map of the environment variable names to
    // their values. Throw runtime_error or system_error if unable to fetch.
    //
    virtual map<string, string>
    fetch (const string& stack) = 0;
  };

  // Vault AppRole login response (only the members we are interested in):
  //
  // {
  //   "auth": {
  //     "client_token": "hvs.CAES...",
  //     "lease_duration": 3600,
  //     ...
  //   },
  //   ...
  // }
  //
  struct vault_auth
  {
    string client_token;
    uint64_t lease_duration = 0; // Seconds.

    explicit
    vault_auth (json::parser&);

    vault_auth () = default;
  };

  // Vault KV version 2 secret read response:
  //
  // {
  //   "data": {
  //     "data": {"DB_PASSWORD": "...", ...},
  //     "metadata": {...}
  //   },
  //   ...
  // }
  //
  // Non-string secret values are not supported.
  //
  struct vault_secret
  {
    map<string, string> data;

    explicit
    vault_secret (json::parser&);

    vault_secret () = default;
  };

  struct vault_settings
  {
    string addr;       // Server address without the trailing slash.
    string role_id;
    string secret_id;
    string mount;      // KV version 2 mount point.
    strings paths;     // Secret paths, may contain the {stack} placeholder.
  };

  // HashiCorp Vault client which authenticates using AppRole and reads the
  // secrets from the KV version 2 secrets engine. The secrets for a stack
  // are merged from the configured paths in order, with the later paths
  // overriding the earlier ones. Missing paths are ignored. The
  // authentication token is cached until a minute before its lease
  // expires. Thread-safe.
  //
  class vault_client: public secret_store
  {
  public:
    explicit
    vault_client (vault_settings);

    virtual map<string, string>
    fetch (const string& stack) override;

    // Return the secret path with the {stack} placeholder replaced with the
    // stack name.
    //
    static string
    secret_path (const string& path, const string& stack);

  private:
    // Return the cached token, logging in if there is none or it is about
    // to expire. Must be called with the mutex locked.
    //
    const string&
    token ();

  private:
    vault_settings settings_;

    std::mutex mutex_;
    optional<string> token_;
    timestamp token_expiration_;
  };
}

#endif // MOD_VAULT_HXX
