// file      : libstackhook/manifest.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBSTACKHOOK_MANIFEST_HXX
#define LIBSTACKHOOK_MANIFEST_HXX

#include <libstackhook/types.hxx>
#include <libstackhook/utility.hxx>

namespace stackhook
{
  // Return the names of the variables referenced in a docker compose
  // manifest. Recognized are the $NAME and ${NAME} forms, including the
  // ${NAME<op>word} interpolation forms (:-, -, :?, ?, :+, +), where NAME
  // matches [A-Z_][A-Z0-9_]*. The $$ sequence is an escaped dollar sign.
  //
  // No attempt is made to understand the YAML structure, so references in
  // comments are returned as well.
  //
  set<string>
  compose_variables (const string& manifest);

  // As above but read the manifest from the stream.
  //
  set<string>
  compose_variables (istream&);

  // As above but read the manifest from the file. Throw io_error if unable
  // to read it.
  //
  set<string>
  compose_variables (const path&);
}

#endif // LIBSTACKHOOK_MANIFEST_HXX
