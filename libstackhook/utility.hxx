// file      : libstackhook/utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBSTACKHOOK_UTILITY_HXX
#define LIBSTACKHOOK_UTILITY_HXX

#include <memory>    // make_shared()
#include <string>    // to_string()
#include <utility>   // move(), forward(), make_pair()
#include <cassert>   // assert()
#include <algorithm> // *

#include <libbutl/utility.hxx> // icasecmp(), trim(), throw_generic_error(),
                               // operator<<(ostream, exception)

namespace stackhook
{
  using std::move;
  using std::forward;

  using std::make_pair;
  using std::make_shared;
  using std::to_string;

  // <libbutl/utility.hxx>
  //
  using butl::icasecmp;
  using butl::trim;
}

#include <libstackhook/version.hxx>

#endif // LIBSTACKHOOK_UTILITY_HXX
