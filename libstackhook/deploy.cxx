// file      : libstackhook/deploy.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libstackhook/deploy.hxx>

#include <libbutl/json/parser.hxx>
#include <libbutl/json/serializer.hxx>

using namespace std;
using namespace butl;

namespace stackhook
{
  string
  to_string (deploy_error e)
  {
    switch (e)
    {
    case deploy_error::unauthorized:      return "unauthorized";
    case deploy_error::bad_request:       return "bad_request";
    case deploy_error::not_found:         return "not_found";
    case deploy_error::too_many_requests: return "too_many_requests";
    case deploy_error::internal_error:    return "internal_error";
    }

    return string (); // Should never reach.
  }

  uint16_t
  to_status (deploy_error e)
  {
    switch (e)
    {
    case deploy_error::unauthorized:      return 401;
    case deploy_error::bad_request:       return 400;
    case deploy_error::not_found:         return 404;
    case deploy_error::too_many_requests: return 429;
    case deploy_error::internal_error:    return 500;
    }

    return 500; // Should never reach.
  }

  string
  json_error (const string& detail)
  {
    string b;
    json::buffer_serializer s (b, 0 /* indentation */);

    s.begin_object ();
    s.member ("ok", false);
    s.member ("detail", detail);
    s.end_object ();

    return b;
  }

  string deploy_failure::
  json () const
  {
    return json_error (detail);
  }

  // deploy_response
  //
  deploy_response::
  deploy_response (string sn, step_results ss, timestamp sa, timestamp fa)
      : ok (all_of (ss.begin (), ss.end (),
                    [] (const step_result& r) {return r.ok;})),
        stack (move (sn)),
        steps (move (ss)),
        started_at (sa),
        finished_at (fa)
  {
  }

  string deploy_response::
  json () const
  {
    string b;
    json::buffer_serializer s (b, 0 /* indentation */);

    s.begin_object ();

    s.member ("ok", ok);
    s.member ("stack", stack);

    s.member_begin_array ("steps");
    for (const step_result& r: steps)
    {
      s.begin_object ();
      s.member ("name", r.name);
      s.member ("ok", r.ok);

      s.member_name ("exit_code");
      if (r.exit_code)
        s.value (*r.exit_code);
      else
        s.value (nullptr);

      s.member ("duration_ms", static_cast<uint64_t> (r.duration.count ()));
      s.member ("tail", r.tail);
      s.end_object ();
    }
    s.end_array ();

    s.member ("started_at", to_iso8601 (started_at));
    s.member ("finished_at", to_iso8601 (finished_at));

    s.end_object ();

    return b;
  }

  // deploy_request
  //
  [[noreturn]] static void
  throw_json (const json::parser& p, const string& m)
  {
    throw json::invalid_json_input (
      p.input_name,
      p.line (), p.column (), p.position (),
      m);
  }

  using event = json::event;

  deploy_request::
  deploy_request (json::parser& p)
  {
    p.next_expect (event::begin_object);

    // Skip unknown members.
    //
    while (p.next_expect (event::name, event::end_object))
    {
      if (p.name () != "stack")
      {
        p.next_expect_value_skip ();
        continue;
      }

      optional<event> e (p.next ());

      if (!e)
        throw_json (p, "unexpected end of input");

      switch (*e)
      {
      case event::string:
        {
          string& v (p.value ());

          if (!v.empty ())
            stack = move (v);
          else
            stack = nullopt;

          break;
        }
      case event::number:
        {
          const string& v (p.value ());

          size_t b (v[0] == '-' ? 1 : 0);

          if (v.size () == b ||
              v.find_first_not_of ("0123456789", b) != string::npos)
            throw invalid_argument ("invalid stack value");

          // Zero is the same as no stack.
          //
          if (v.find_first_not_of ('0', b) != string::npos)
            stack = v;
          else
            stack = nullopt;

          break;
        }
      case event::boolean:
        {
          if (p.value () == "true")
            throw invalid_argument ("invalid stack value");

          stack = nullopt;
          break;
        }
      case event::null:
        {
          stack = nullopt;
          break;
        }
      default:
        throw invalid_argument ("invalid stack value");
      }
    }

    // Make sure there is nothing after the object.
    //
    if (p.next ())
      throw_json (p, "unexpected value after request object");
  }

  string
  to_iso8601 (timestamp t)
  {
    using namespace chrono;

    string r (butl::to_string (t,
                               "%Y-%m-%dT%T",
                               false /* special */,
                               false /* local */));

    uint64_t ms (
      duration_cast<milliseconds> (t.time_since_epoch ()).count () % 1000);

    r += '.';
    r += static_cast<char> ('0' + ms / 100);
    r += static_cast<char> ('0' + ms / 10 % 10);
    r += static_cast<char> ('0' + ms % 10);
    r += 'Z';

    return r;
  }
}
