// file      : tests/orchestrate/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <chrono>
#include <iostream>

#include <libbutl/utility.hxx>    // operator<<(ostream,exception)
#include <libbutl/fdstream.hxx>
#include <libbutl/filesystem.hxx>

#include <libstackhook/types.hxx>
#include <libstackhook/utility.hxx>

#include <mod/deploy.hxx>
#include <mod/diagnostics.hxx>

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

static string
read_file (const path& f)
{
  ifdstream is (f);
  string r (is.read_text ());
  is.close ();
  return r;
}

int
main ()
try
{
  // Service count.
  //
  assert (count_services ("") == 0);
  assert (count_services ("\n\n  \n") == 0);
  assert (count_services ("web\n") == 1);
  assert (count_services ("web\ndb") == 2);
  assert (count_services ("web\n\n db \n") == 2);

  // The fake docker executable records its command line and answers from
  // the files in the current (stack) directory.
  //
  dir_path tmp (dir_path::temp_path ("stackhook-orchestrate"));
  try_mkdir_p (tmp);
  auto_rmdir rm (tmp);

  path docker (tmp / "docker");
  write_file (docker,
              "#!/bin/sh\n"
              "echo \"$*\" >>calls\n"
              "case \"$2\" in\n"
              "  ps)     cat services 2>/dev/null ;;\n"
              "  config) if [ -f config-fail ]; then\n"
              "            echo 'services.web.image must be a string'\n"
              "            exit 15\n"
              "          fi\n"
              "          echo 'services: {}' ;;\n"
              "  pull)   if [ -f pull-hang ]; then\n"
              "            echo pulling\n"
              "            exec sleep 5\n"
              "          fi\n"
              "          echo pulled ;;\n"
              "  up)     echo started ;;\n"
              "esac\n");
  path_permissions (docker,
                    permissions::ru | permissions::wu | permissions::xu);

  dir_path stack (tmp / dir_path ("web"));
  try_mkdir_p (stack);

  deploy_settings ds {docker, 10, 10, 10, 10};

  diag_data records;
  diag_epilogue ep ([&records] (diag_data&& d)
                    {
                      for (diag_entry& e: d)
                        records.push_back (move (e));
                    });

  basic_mark info (severity::info, ep);
  basic_mark warn (severity::warning, ep);

  auto deploy = [&ds, &stack, &info, &warn, &records] ()
  {
    records.clear ();
    try_rmfile (stack / "calls");
    return run_deploy (ds, "web", stack, strings (), info, warn);
  };

  // All steps succeed.
  //
  {
    write_file (stack / "services", "web\ndb\n");

    step_results r (deploy ());

    assert (r.size () == 4);
    assert (r[0].name == "status" && r[0].ok && r[0].tail == "web\ndb\n");
    assert (r[1].name == "config" && r[1].ok);
    assert (r[2].name == "pull" && r[2].ok && r[2].tail == "pulled\n");
    assert (r[3].name == "up" && r[3].ok && r[3].tail == "started\n");

    assert (read_file (stack / "calls") ==
            "compose ps --status=running --services\n"
            "compose config\n"
            "compose pull\n"
            "compose up -d --remove-orphans\n");

    assert (records.size () == 4);
  }

  // No running services.
  //
  {
    write_file (stack / "services", "\n");

    step_results r (deploy ());

    assert (r.size () == 1);
    assert (r[0].name == "status");
    assert (!r[0].ok);
    assert (r[0].exit_code && *r[0].exit_code == 0);
    assert (r[0].tail == "\n\nNo running services found; aborting deploy.");

    assert (read_file (stack / "calls") ==
            "compose ps --status=running --services\n");
  }

  // Invalid compose configuration.
  //
  {
    write_file (stack / "services", "web\n");
    write_file (stack / "config-fail", "");

    step_results r (deploy ());

    assert (r.size () == 2);
    assert (r[0].ok);
    assert (!r[1].ok);
    assert (r[1].exit_code && *r[1].exit_code == 15);
    assert (r[1].tail == "services.web.image must be a string\n");

    assert (records.size () == 2);
    assert (records[1].sev == severity::warning);

    try_rmfile (stack / "config-fail");
  }

  // Pull times out and the deployment stops there.
  //
  {
    write_file (stack / "services", "web\n");
    write_file (stack / "pull-hang", "");
    ds.pull_timeout = 1;

    step_results r (deploy ());

    assert (r.size () == 3);
    assert (r[0].ok && r[1].ok);
    assert (r[2].name == "pull");
    assert (!r[2].ok);
    assert (!r[2].exit_code);
    assert (r[2].duration < chrono::seconds (4));
    assert (r[2].tail.compare (0, 17, "timeout after 1s:") == 0);
    assert (r[2].tail.find ("pulling") == string::npos);

    string c (read_file (stack / "calls"));
    assert (c.find ("compose pull\n") != string::npos);
    assert (c.find ("compose up") == string::npos);

    assert (records.size () == 3);
    assert (records[2].sev == severity::warning);
    assert (records[2].msg.find ("\"event\":\"step_timeout\"") !=
            string::npos);

    ds.pull_timeout = 10;
    try_rmfile (stack / "pull-hang");
  }

  // Environment reaches the docker commands.
  //
  {
    write_file (docker,
                "#!/bin/sh\n"
                "echo \"$DOCKER_CONFIG\"\n");

    step_results r (run_deploy (ds, "web", stack,
                                strings {"DOCKER_CONFIG=/stacks/web/.docker"},
                                info, warn));

    assert (r.size () == 4);
    assert (r[0].tail == "/stacks/web/.docker\n");
  }

  return 0;
}
catch (const std::exception& e)
{
  cerr << e << endl;
  return 1;
}
