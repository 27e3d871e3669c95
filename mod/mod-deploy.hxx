// file      : mod/mod-deploy.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MOD_MOD_DEPLOY_HXX
#define MOD_MOD_DEPLOY_HXX

#include <libstackhook/types.hxx>
#include <libstackhook/utility.hxx>

#include <mod/vault.hxx>
#include <mod/deploy.hxx>
#include <mod/module.hxx>
#include <mod/module-options.hxx>

namespace stackhook
{
  // Handle the signed deployment requests:
  //
  // POST <root>/deploy/<stack>
  // POST <root>/deploy          {"stack": "<stack>"}
  //
  // The request is authenticated with the X-Signature header that contains
  // the hex-encoded HMAC-SHA256 of the request body (or of the stack name,
  // if the body is empty and the stack is specified in the URL path). On
  // success run the deployment steps and respond with the deployment
  // result.
  //
  class deploy: public handler
  {
  public:
    // The stack name from the request URL path, if present. Set by the
    // request dispatcher.
    //
    optional<string> stack;

    deploy () = default;

    // Create a shallow copy (handling instance) if initialized and a deep
    // copy (context exemplar) otherwise.
    //
    explicit
    deploy (const deploy&);

    virtual bool
    handle (request&, response&);

    virtual const cli::options&
    cli_options () const {return options::deploy::description ();}

  private:
    virtual void
    init (cli::scanner&);

    // Answer the request with the failure status and JSON body.
    //
    [[noreturn]] void
    reject (const deploy_failure&) const;

    // Add the stack secrets referenced by the stack manifest to the
    // environment (NAME=VALUE).
    //
    void
    add_secrets (const string& stack, const dir_path&, strings& env);

  private:
    shared_ptr<options::deploy> options_;

    // The shared secret the request signatures are verified with.
    //
    string secret_;

    deploy_settings settings_ {};

    // NULL if the secrets store is not configured.
    //
    shared_ptr<secret_store> secrets_;
  };
}

#endif // MOD_MOD_DEPLOY_HXX
