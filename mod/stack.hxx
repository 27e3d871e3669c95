// file      : mod/stack.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MOD_STACK_HXX
#define MOD_STACK_HXX

#include <libstackhook/types.hxx>
#include <libstackhook/utility.hxx>

#include <libstackhook/deploy.hxx>

namespace stackhook
{
  // Return true if the stack name is non-empty and only contains ASCII
  // letters, digits, '_', and '-'.
  //
  bool
  valid_stack_name (const string&);

  // Map stack names to the stack directories under the stacks root.
  //
  class stack_resolver
  {
  public:
    explicit
    stack_resolver (dir_path root): root_ (move (root)) {}

    // Return the real (absolute, normalized, and with symlinks resolved)
    // stack directory path or the failure:
    //
    // bad_request    - invalid stack name, the stack directory (symlink)
    //                  points outside the stacks root, or there is no
    //                  docker-compose.yml in the stack directory
    // not_found      - no stack directory
    // internal_error - the stacks root doesn't exist
    //
    // Throw system_error if unable to query the filesystem.
    //
    checked<dir_path>
    resolve (const string& name) const;

    const dir_path&
    root () const {return root_;}

  private:
    dir_path root_;
  };

  // Return the environment variable assignments (NAME=VALUE) the docker
  // commands are run with for the stack. Currently, this is
  // DOCKER_CONFIG=<stack>/.docker if the stack has the .docker/config.json
  // file, so that the private registry credentials are stack-specific.
  //
  strings
  docker_environment (const dir_path& stack);
}

#endif // MOD_STACK_HXX
