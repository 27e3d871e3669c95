// file      : tests/rate-limiter/driver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <chrono>
#include <atomic>
#include <thread>
#include <iostream>

#include <libbutl/utility.hxx> // operator<<(ostream,exception)

#include <libstackhook/types.hxx>
#include <libstackhook/utility.hxx>

#include <mod/rate-limiter.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace butl;
using namespace stackhook;

int
main ()
try
{
  using namespace chrono;

  const timestamp t0 (seconds (1714557600));

  // Quota within the window.
  //
  {
    sliding_window_limiter l (3);

    assert (l.admit ("10.0.0.1", t0));
    assert (l.admit ("10.0.0.1", t0 + seconds (1)));
    assert (l.admit ("10.0.0.1", t0 + seconds (2)));
    assert (!l.admit ("10.0.0.1", t0 + seconds (3)));

    // Other clients are not affected.
    //
    assert (l.admit ("10.0.0.2", t0 + seconds (3)));

    // The oldest request leaves the window only after exactly 60 seconds
    // have passed.
    //
    assert (!l.admit ("10.0.0.1", t0 + seconds (60)));
    assert (l.admit ("10.0.0.1", t0 + seconds (60) + milliseconds (1)));
    assert (!l.admit ("10.0.0.1", t0 + seconds (61)));
    assert (l.admit ("10.0.0.1", t0 + seconds (62)));
  }

  // Rejected requests are not recorded.
  //
  {
    sliding_window_limiter l (1);

    assert (l.admit ("c", t0));

    for (int i (1); i != 60; ++i)
      assert (!l.admit ("c", t0 + seconds (i)));

    assert (l.admit ("c", t0 + seconds (61)));
  }

  // Zero quota.
  //
  {
    sliding_window_limiter l (0);

    assert (!l.admit ("c", t0));
    assert (!l.admit ("c", t0 + hours (1)));
  }

  // Custom window.
  //
  {
    sliding_window_limiter l (1, seconds (1));

    assert (l.admit ("c", t0));
    assert (!l.admit ("c", t0 + milliseconds (500)));
    assert (l.admit ("c", t0 + milliseconds (1001)));
  }

  // Idle clients are forgotten.
  //
  {
    sliding_window_limiter l (10);

    assert (l.admit ("a", t0));
    assert (l.admit ("b", t0 + seconds (30)));
    assert (l.clients () == 2);

    assert (l.admit ("c", t0 + seconds (200)));
    assert (l.clients () == 1);
  }

  // Concurrent requests from the same client.
  //
  {
    sliding_window_limiter l (10);
    atomic<size_t> admitted (0);

    vector<thread> ts;
    for (size_t i (0); i != 8; ++i)
    {
      ts.emplace_back ([&l, &admitted, t0] ()
                       {
                         for (size_t j (0); j != 10; ++j)
                         {
                           if (l.admit ("10.0.0.1", t0))
                             ++admitted;
                         }
                       });
    }

    for (thread& t: ts)
      t.join ();

    assert (admitted == 10);
  }

  return 0;
}
catch (const std::exception& e)
{
  cerr << e << endl;
  return 1;
}
