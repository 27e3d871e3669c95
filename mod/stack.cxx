// file      : mod/stack.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mod/stack.hxx>

#include <libbutl/filesystem.hxx> // dir_exists(), file_exists(), entry_exists()

using namespace std;
using namespace butl;

namespace stackhook
{
  bool
  valid_stack_name (const string& n)
  {
    if (n.empty ())
      return false;

    for (char c: n)
    {
      if (!((c >= 'a' && c <= 'z') ||
            (c >= 'A' && c <= 'Z') ||
            (c >= '0' && c <= '9') ||
            c == '_' || c == '-'))
        return false;
    }

    return true;
  }

  checked<dir_path> stack_resolver::
  resolve (const string& n) const
  {
    if (!valid_stack_name (n))
      return deploy_failure (deploy_error::bad_request, "invalid stack name");

    auto root_missing = [] ()
    {
      return deploy_failure (deploy_error::internal_error,
                             "stacks root missing");
    };

    // Note that the root can disappear at any time, so we check it for each
    // request rather than once during the initialization.
    //
    dir_path r;
    try
    {
      r = root_;
      r.complete ().normalize ();

      if (!dir_exists (r))
        return root_missing ();

      r.realize ();
    }
    catch (const invalid_path&)
    {
      return root_missing ();
    }

    dir_path d (r / dir_path (n));

    // Note that the directory entry can be a symlink, potentially dangling,
    // which we treat as non-existent.
    //
    if (!entry_exists (d, false /* follow_symlinks */))
      return deploy_failure (deploy_error::not_found, "stack not found");

    try
    {
      d.realize ();
    }
    catch (const invalid_path&)
    {
      return deploy_failure (deploy_error::not_found, "stack not found");
    }

    // Note that the root itself is a valid stack directory.
    //
    if (!d.sub (r))
      return deploy_failure (deploy_error::bad_request, "invalid stack path");

    if (!dir_exists (d))
      return deploy_failure (deploy_error::not_found, "stack not found");

    if (!file_exists (d / "docker-compose.yml"))
      return deploy_failure (deploy_error::bad_request,
                             "docker-compose.yml missing");

    return d;
  }

  strings
  docker_environment (const dir_path& s)
  {
    strings r;

    dir_path d (s / dir_path (".docker"));

    if (file_exists (d / "config.json"))
      r.push_back ("DOCKER_CONFIG=" + d.string ());

    return r;
  }
}
