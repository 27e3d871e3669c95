// file      : tests/manifest/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <sstream>
#include <iostream>

#include <libbutl/utility.hxx> // operator<<(ostream,exception)

#include <libstackhook/types.hxx>
#include <libstackhook/utility.hxx>

#include <libstackhook/manifest.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace butl;
using namespace stackhook;

int
main ()
try
{
  using vars = set<string>;

  // Plain and braced references.
  //
  assert (compose_variables ("image: $IMAGE\n") == vars ({"IMAGE"}));
  assert (compose_variables ("image: ${IMAGE}:${TAG}\n") ==
          vars ({"IMAGE", "TAG"}));

  assert (compose_variables ("a: $A_1 b: ${_B}") == vars ({"A_1", "_B"}));

  // Interpolation operators.
  //
  assert (compose_variables ("${IMAGE:-nginx}") == vars ({"IMAGE"}));
  assert (compose_variables ("${IMAGE-nginx}") == vars ({"IMAGE"}));
  assert (compose_variables ("${REQUIRED:?must be set}") ==
          vars ({"REQUIRED"}));
  assert (compose_variables ("${REQUIRED?x}") == vars ({"REQUIRED"}));
  assert (compose_variables ("${ALT:+yes} ${ALT2+no}") ==
          vars ({"ALT", "ALT2"}));

  // Not references.
  //
  assert (compose_variables ("cmd: echo $$NOT_A_VAR") == vars ());
  assert (compose_variables ("${lowercase} $lower ${1X}") == vars ());
  assert (compose_variables ("${NAME") == vars ());
  assert (compose_variables ("${NAME:x}") == vars ());
  assert (compose_variables ("${NAME!}") == vars ());
  assert (compose_variables ("price: 5$") == vars ());
  assert (compose_variables ("") == vars ());

  // Escaped dollar followed by a reference.
  //
  assert (compose_variables ("$$$API_KEY") == vars ({"API_KEY"}));

  // Duplicates and multi-line manifest.
  //
  {
    istringstream is (
      "services:\n"
      "  web:\n"
      "    image: ${IMAGE:-nginx}\n"
      "    environment:\n"
      "      - API_KEY=$API_KEY\n"
      "      - DB_URL=${DB_URL}\n"
      "      - LITERAL=$$HOME\n"
      "  # uses $IMAGE too\n");

    assert (compose_variables (is) == vars ({"API_KEY", "DB_URL", "IMAGE"}));
  }

  return 0;
}
catch (const std::exception& e)
{
  cerr << e << endl;
  return 1;
}
