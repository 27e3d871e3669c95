// file      : libstackhook/manifest.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libstackhook/manifest.hxx>

#include <iterator> // istreambuf_iterator

#include <libbutl/fdstream.hxx>

using namespace std;
using namespace butl;

namespace stackhook
{
  static inline bool
  name_start (char c)
  {
    return (c >= 'A' && c <= 'Z') || c == '_';
  }

  static inline bool
  name_char (char c)
  {
    return name_start (c) || (c >= '0' && c <= '9');
  }

  set<string>
  compose_variables (const string& m)
  {
    set<string> r;

    for (size_t i (0), n (m.size ()); i != n; )
    {
      if (m[i++] != '$' || i == n)
        continue;

      char c (m[i]);

      // Escaped dollar.
      //
      if (c == '$')
      {
        ++i;
        continue;
      }

      bool braced (c == '{');
      size_t b (braced ? i + 1 : i);

      if (b == n || !name_start (m[b]))
        continue;

      size_t e (b + 1);
      for (; e != n && name_char (m[e]); ++e) ;

      // In the braced form the name must be followed by the closing brace
      // or an interpolation operator.
      //
      if (braced)
      {
        if (e == n)
          continue;

        char d (m[e]);
        if (d != '}' && d != ':' && d != '-' && d != '?' && d != '+')
          continue;

        if (d == ':' &&
            (e + 1 == n ||
             (m[e + 1] != '-' && m[e + 1] != '?' && m[e + 1] != '+')))
          continue;
      }

      r.insert (string (m, b, e - b));
      i = e;
    }

    return r;
  }

  set<string>
  compose_variables (istream& is)
  {
    string m ((istreambuf_iterator<char> (is)),
              istreambuf_iterator<char> ());
    return compose_variables (m);
  }

  set<string>
  compose_variables (const path& f)
  {
    ifdstream is (f);
    string m (is.read_text ());
    is.close ();

    return compose_variables (m);
  }
}
