// file      : mod/rate-limiter.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MOD_RATE_LIMITER_HXX
#define MOD_RATE_LIMITER_HXX

#include <deque>
#include <mutex>
#include <chrono>

#include <libstackhook/types.hxx>
#include <libstackhook/utility.hxx>

namespace stackhook
{
  // Request admission control keyed by the client identity (normally the
  // client IP address).
  //
  class admission_control
  {
  public:
    virtual
    ~admission_control () = default;

    // Return true and record the request if the client is admitted and
    // false otherwise. Rejected requests are not recorded.
    //
    virtual bool
    admit (const string& client, timestamp now) = 0;
  };

  // Sliding window rate limiter which admits at most quota requests per
  // client within any window-long period. A zero quota rejects every
  // request. Thread-safe.
  //
  class sliding_window_limiter: public admission_control
  {
  public:
    explicit
    sliding_window_limiter (size_t quota,
                            duration window = std::chrono::seconds (60));

    virtual bool
    admit (const string& client, timestamp now) override;

    // Number of clients currently tracked.
    //
    size_t
    clients () const;

  private:
    size_t quota_;
    duration window_;

    mutable std::mutex mutex_;
    map<string, std::deque<timestamp>> requests_;

    // The time of the last sweep of the idle clients.
    //
    timestamp swept_;
  };
}

#endif // MOD_RATE_LIMITER_HXX
