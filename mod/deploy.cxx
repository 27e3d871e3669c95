// file      : mod/deploy.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mod/deploy.hxx>

#include <mod/command.hxx>

using namespace std;

namespace stackhook
{
  size_t
  count_services (const string& s)
  {
    size_t r (0);

    for (size_t b (0), e; b < s.size (); b = e + 1)
    {
      e = s.find ('\n', b);

      if (e == string::npos)
        e = s.size ();

      string l (s, b, e - b);
      if (!trim (l).empty ())
        ++r;
    }

    return r;
  }

  step_results
  run_deploy (const deploy_settings& ds,
              const string& stack,
              const dir_path& dir,
              const strings& env,
              const basic_mark& info,
              const basic_mark& warn,
              const basic_mark* trace)
  {
    struct step
    {
      const char* name;
      strings args;
      size_t timeout;
    };

    const step steps[] = {
      {"status",
       {"compose", "ps", "--status=running", "--services"},
       ds.status_timeout},
      {"config", {"compose", "config"}, ds.config_timeout},
      {"pull", {"compose", "pull"}, ds.pull_timeout},
      {"up", {"compose", "up", "-d", "--remove-orphans"}, ds.up_timeout}};

    step_results r;

    for (const step& s: steps)
    {
      r.push_back (run_step (stack,
                             s.name,
                             ds.docker,
                             s.args,
                             dir,
                             env,
                             s.timeout,
                             info,
                             warn,
                             trace));

      step_result& sr (r.back ());

      // Note that the service names are counted in the (sanitized) tail
      // rather than the full output. Since the names are listed one per
      // line this only matters if the output is truncated, in which case
      // there are services listed anyway.
      //
      if (r.size () == 1 && sr.ok && count_services (sr.tail) == 0)
      {
        sr.ok = false;
        sr.tail += "\nNo running services found; aborting deploy.";
      }

      if (!sr.ok)
        break;
    }

    return r;
  }
}
