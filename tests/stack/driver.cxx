// file      : tests/stack/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <iostream>

#include <libbutl/utility.hxx>    // operator<<(ostream,exception)
#include <libbutl/fdstream.hxx>
#include <libbutl/filesystem.hxx>

#include <libstackhook/types.hxx>
#include <libstackhook/utility.hxx>

#include <mod/stack.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace butl;
using namespace stackhook;

static void
write_file (const path& f, const string& s)
{
  ofdstream os (f);
  os << s;
  os.close ();
}

static bool
failed (const checked<dir_path>& r, deploy_error e, const string& d)
{
  return !r && r.failure ().error == e && r.failure ().detail == d;
}

int
main ()
try
{
  // Names.
  //
  assert (valid_stack_name ("web"));
  assert (valid_stack_name ("Web_2-prod"));
  assert (!valid_stack_name (""));
  assert (!valid_stack_name ("."));
  assert (!valid_stack_name (".."));
  assert (!valid_stack_name ("a/b"));
  assert (!valid_stack_name ("a b"));
  assert (!valid_stack_name ("web\n"));
  assert (!valid_stack_name ("caf\xc3\xa9"));

  // Filesystem layout:
  //
  // <tmp>/
  //   outside/                   (docker-compose.yml)
  //   stacks/
  //     web/                     (docker-compose.yml, .docker/config.json)
  //     db/                      (docker-compose.yml)
  //     empty/
  //     file                     (regular file)
  //     escape -> ../outside/
  //     inside -> web/
  //     dangling -> missing/
  //
  dir_path tmp (dir_path::temp_path ("stackhook-stack"));
  try_mkdir_p (tmp);
  auto_rmdir rm (tmp);

  dir_path root (tmp / dir_path ("stacks"));
  dir_path outside (tmp / dir_path ("outside"));

  dir_path web (root / dir_path ("web"));
  dir_path db (root / dir_path ("db"));

  try_mkdir_p (web / dir_path (".docker"));
  try_mkdir_p (db);
  try_mkdir_p (root / dir_path ("empty"));
  try_mkdir_p (outside);

  write_file (web / "docker-compose.yml", "services: {}\n");
  write_file (web / dir_path (".docker") / "config.json", "{}\n");
  write_file (db / "docker-compose.yml", "services: {}\n");
  write_file (outside / "docker-compose.yml", "services: {}\n");
  write_file (root / "file", "");

  mksymlink (outside, root / "escape", true /* dir */);
  mksymlink (web, root / "inside", true /* dir */);
  mksymlink (root / dir_path ("missing"), root / "dangling", true /* dir */);

  // Note that the temporary directory path may itself contain symlinks.
  //
  dir_path real_root (root);
  real_root.realize ();

  stack_resolver sr (root);

  {
    checked<dir_path> r (sr.resolve ("web"));
    assert (r && *r == real_root / dir_path ("web"));
  }

  {
    checked<dir_path> r (sr.resolve ("db"));
    assert (r && *r == real_root / dir_path ("db"));
  }

  // Symlink that stays inside the root resolves to its target.
  //
  {
    checked<dir_path> r (sr.resolve ("inside"));
    assert (r && *r == real_root / dir_path ("web"));
  }

  // Symlink to the root itself.
  //
  {
    write_file (root / "docker-compose.yml", "services: {}\n");
    mksymlink (root, root / "self", true /* dir */);

    checked<dir_path> r (sr.resolve ("self"));
    assert (r && *r == real_root);

    try_rmsymlink (root / "self", true /* dir */);
    try_rmfile (root / "docker-compose.yml");
  }

  assert (failed (sr.resolve (".."),
                  deploy_error::bad_request, "invalid stack name"));
  assert (failed (sr.resolve ("../outside"),
                  deploy_error::bad_request, "invalid stack name"));
  assert (failed (sr.resolve (""),
                  deploy_error::bad_request, "invalid stack name"));

  assert (failed (sr.resolve ("escape"),
                  deploy_error::bad_request, "invalid stack path"));

  assert (failed (sr.resolve ("empty"),
                  deploy_error::bad_request, "docker-compose.yml missing"));

  assert (failed (sr.resolve ("nope"),
                  deploy_error::not_found, "stack not found"));
  assert (failed (sr.resolve ("dangling"),
                  deploy_error::not_found, "stack not found"));
  assert (failed (sr.resolve ("file"),
                  deploy_error::not_found, "stack not found"));

  // Relative root is completed against the current working directory.
  //
  {
    dir_path cwd (dir_path::current_directory ());
    dir_path::current_directory (tmp);

    stack_resolver rr (dir_path ("stacks"));
    checked<dir_path> r (rr.resolve ("db"));

    dir_path::current_directory (cwd);

    assert (r && *r == real_root / dir_path ("db"));
  }

  // Missing root.
  //
  {
    stack_resolver mr (tmp / dir_path ("nonexistent"));

    assert (failed (mr.resolve ("web"),
                    deploy_error::internal_error, "stacks root missing"));

    // The name is validated first.
    //
    assert (failed (mr.resolve ("a.b"),
                    deploy_error::bad_request, "invalid stack name"));
  }

  // Docker environment.
  //
  {
    strings e (docker_environment (web));
    assert (e.size () == 1);
    assert (e[0] == "DOCKER_CONFIG=" + (web / dir_path (".docker")).string ());

    assert (docker_environment (db).empty ());

    // The .docker directory without the config is ignored.
    //
    try_mkdir_p (db / dir_path (".docker"));
    assert (docker_environment (db).empty ());
  }

  try_rmsymlink (root / "dangling", true /* dir */);

  return 0;
}
catch (const std::exception& e)
{
  cerr << e << endl;
  return 1;
}
