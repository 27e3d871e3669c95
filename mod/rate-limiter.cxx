// file      : mod/rate-limiter.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mod/rate-limiter.hxx>

using namespace std;

namespace stackhook
{
  sliding_window_limiter::
  sliding_window_limiter (size_t q, duration w)
      : quota_ (q), window_ (w), swept_ (timestamp_unknown)
  {
  }

  bool sliding_window_limiter::
  admit (const string& client, timestamp now)
  {
    lock_guard<mutex> l (mutex_);

    // Drop the clients with no requests within the window, so that the map
    // doesn't grow unbounded. Do it at most once per window.
    //
    if (swept_ == timestamp_unknown || now - swept_ >= window_)
    {
      for (auto i (requests_.begin ()); i != requests_.end (); )
      {
        const deque<timestamp>& q (i->second);

        if (q.empty () || now - q.back () > window_)
          i = requests_.erase (i);
        else
          ++i;
      }

      swept_ = now;
    }

    if (quota_ == 0)
      return false;

    deque<timestamp>& q (requests_[client]);

    // Evict the requests that are older than the window.
    //
    while (!q.empty () && now - q.front () > window_)
      q.pop_front ();

    if (q.size () >= quota_)
      return false;

    q.push_back (now);
    return true;
  }

  size_t sliding_window_limiter::
  clients () const
  {
    lock_guard<mutex> l (mutex_);
    return requests_.size ();
  }
}
