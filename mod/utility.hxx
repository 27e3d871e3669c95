// file      : mod/utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MOD_UTILITY_HXX
#define MOD_UTILITY_HXX

#include <libbutl/json/serializer.hxx>

#include <libstackhook/types.hxx>
#include <libstackhook/utility.hxx>

#include <libstackhook/deploy.hxx> // to_iso8601()

namespace stackhook
{
  // Serialize a structured log event as a single-line JSON object:
  //
  // {"ts": "2024-05-01T10:00:00.123Z", "event": "<event>", ...}
  //
  // The event-specific members are added by the function which is called
  // with the serializer positioned inside the object.
  //
  template <typename F>
  string
  log_event (const char* event, F&& members)
  {
    string b;
    json::buffer_serializer s (b, 0 /* indentation */);

    s.begin_object ();
    s.member ("ts", to_iso8601 (system_clock::now ()));
    s.member ("event", event);
    members (s);
    s.end_object ();

    return b;
  }
}

#endif // MOD_UTILITY_HXX
