// file      : mod/deploy.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MOD_DEPLOY_HXX
#define MOD_DEPLOY_HXX

#include <libstackhook/types.hxx>
#include <libstackhook/utility.hxx>

#include <libstackhook/deploy.hxx>

#include <mod/diagnostics.hxx>

namespace stackhook
{
  // The deployment steps configuration. The timeouts are in seconds.
  //
  struct deploy_settings
  {
    path docker;
    size_t status_timeout;
    size_t config_timeout;
    size_t pull_timeout;
    size_t up_timeout;
  };

  // Run the deployment steps for the stack in the stack directory with the
  // additional environment variables (NAME=VALUE):
  //
  // status - docker compose ps --status=running --services
  // config - docker compose config
  // pull   - docker compose pull
  // up     - docker compose up -d --remove-orphans
  //
  // Stop at the first failed step and return the attempted steps. The
  // status step fails if no running services are listed, so that a stack
  // that is down is not brought up by the deployment.
  //
  step_results
  run_deploy (const deploy_settings&,
              const string& stack,
              const dir_path& dir,
              const strings& env,
              const basic_mark& info,
              const basic_mark& warn,
              const basic_mark* trace = nullptr);

  // Return the number of services listed in the status step output (one per
  // non-blank line).
  //
  size_t
  count_services (const string&);
}

#endif // MOD_DEPLOY_HXX
