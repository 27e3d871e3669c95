// file      : mod/types-parsers.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mod/types-parsers.hxx>

#include <mod/module-options.hxx>

using namespace std;

namespace stackhook
{
  namespace cli
  {
    // Parse path. Note that an empty path is invalid.
    //
    template <typename T>
    static void
    parse_path (T& x, scanner& s)
    {
      const char* o (s.next ());

      if (!s.more ())
        throw missing_value (o);

      const char* v (s.next ());

      try
      {
        x = T (v);

        if (x.empty ())
          throw invalid_value (o, v);
      }
      catch (const invalid_path&)
      {
        throw invalid_value (o, v);
      }
    }

    void parser<path>::
    parse (path& x, bool& xs, scanner& s)
    {
      xs = true;
      parse_path (x, s);
    }

    void parser<dir_path>::
    parse (dir_path& x, bool& xs, scanner& s)
    {
      xs = true;
      parse_path (x, s);
    }
  }
}
