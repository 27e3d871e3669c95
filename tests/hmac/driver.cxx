// file      : tests/hmac/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <iostream>

#include <libbutl/utility.hxx> // operator<<(ostream,exception)

#include <libstackhook/types.hxx>
#include <libstackhook/utility.hxx>

#include <mod/hmac.hxx>
#include <mod/module-options.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace butl;
using namespace stackhook;

int
main ()
try
{
  options::openssl_options o;

  // RFC 4231 test case 2.
  //
  const string key ("Jefe");
  const string msg ("what do ya want for nothing?");
  const string mac (
    "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");

  assert (compute_hmac (o, msg.data (), msg.size (), key) == mac);

  // Constant time comparison.
  //
  assert (constant_time_equal ("", ""));
  assert (constant_time_equal ("abc", "abc"));
  assert (!constant_time_equal ("abc", "abd"));
  assert (!constant_time_equal ("abc", "abcd"));
  assert (!constant_time_equal ("abc", ""));

  // Signature verification.
  //
  auto verify = [&o, &key, &msg] (const string& sig)
  {
    return verify_signature (o, msg.data (), msg.size (), key, sig);
  };

  assert (!verify (mac));
  assert (!verify ("  " + mac + "\n"));

  {
    string s (mac);
    for (char& c: s)
      c = static_cast<char> (toupper (static_cast<unsigned char> (c)));

    assert (!verify (s));
  }

  {
    optional<deploy_failure> f (verify (""));
    assert (f && f->error == deploy_error::unauthorized &&
            f->detail == "missing signature");
  }

  {
    optional<deploy_failure> f (verify (" \t "));
    assert (f && f->detail == "missing signature");
  }

  {
    optional<deploy_failure> f (verify ("deadbeef"));
    assert (f && f->error == deploy_error::unauthorized &&
            f->detail == "invalid signature");
  }

  {
    string s (mac);
    s.back () = '4';

    optional<deploy_failure> f (verify (s));
    assert (f && f->detail == "invalid signature");
  }

  // Signature over a different key.
  //
  {
    optional<deploy_failure> f (
      verify_signature (o, msg.data (), msg.size (), "jefe", mac));
    assert (f && f->detail == "invalid signature");
  }

  // Empty message (signature over an empty body).
  //
  {
    string h (compute_hmac (o, "", 0, key));
    assert (h.size () == 64);
    assert (!verify_signature (o, "", 0, key, h));
  }

  return 0;
}
catch (const std::exception& e)
{
  cerr << e << endl;
  return 1;
}
