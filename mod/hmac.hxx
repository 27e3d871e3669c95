// file      : mod/hmac.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MOD_HMAC_HXX
#define MOD_HMAC_HXX

#include <libstackhook/types.hxx>
#include <libstackhook/utility.hxx>

#include <libstackhook/deploy.hxx>

#include <mod/module-options.hxx>

namespace stackhook
{
  // Compute the HMAC-SHA256 message authentication code over a message using
  // the given key and return it as a lower-case hex string. Throw
  // std::system_error in case of an error.
  //
  // Example output:
  //
  //   5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843
  //
  string
  compute_hmac (const options::openssl_options&,
                const void* message, size_t len,
                const string& key);

  // Compare two strings in time that only depends on their lengths.
  //
  bool
  constant_time_equal (const string&, const string&);

  // Verify the request signature (hex-encoded HMAC-SHA256 of the message
  // with the shared secret as a key). The surrounding whitespaces are
  // ignored and the hex digits are compared case-insensitively.
  //
  // Return the failure (unauthorized) if the signature is missing (empty)
  // or doesn't match and nullopt otherwise. Throw std::system_error if
  // unable to compute the HMAC.
  //
  optional<deploy_failure>
  verify_signature (const options::openssl_options&,
                    const void* message, size_t len,
                    const string& secret,
                    const string& signature);
}

#endif // MOD_HMAC_HXX
