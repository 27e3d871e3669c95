// file      : libstackhook/deploy.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBSTACKHOOK_DEPLOY_HXX
#define LIBSTACKHOOK_DEPLOY_HXX

#include <chrono>

#include <libstackhook/types.hxx>
#include <libstackhook/utility.hxx>

namespace butl
{
  namespace json
  {
    class parser;
  }
}

namespace stackhook
{
  namespace json = butl::json;

  // Reason for rejecting a deployment request before any command runs.
  //
  enum class deploy_error
  {
    unauthorized,
    bad_request,
    not_found,
    too_many_requests,
    internal_error
  };

  string
  to_string (deploy_error);

  // Return the HTTP status code the request is answered with.
  //
  uint16_t
  to_status (deploy_error);

  inline ostream&
  operator<< (ostream& os, deploy_error e)
  {
    return os << to_string (e);
  }

  struct deploy_failure
  {
    deploy_error error;
    string detail;

    deploy_failure (deploy_error e, string d): error (e), detail (move (d)) {}

    // Serialize as the error response body:
    //
    // {"ok": false, "detail": "<detail>"}
    //
    string
    json () const;
  };

  // Serialize the error response body with the specified detail.
  //
  string
  json_error (const string& detail);

  // The outcome of a request validation step: either the validated value or
  // the reason the request is rejected.
  //
  template <typename T>
  class checked
  {
  public:
    checked (T v): value_ (move (v)) {}
    checked (deploy_failure f): failure_ (move (f)) {}

    explicit operator bool () const {return !failure_;}

    T&       operator* ()        {return *value_;}
    const T& operator* () const  {return *value_;}
    const T* operator-> () const {return &*value_;}

    const deploy_failure&
    failure () const {return *failure_;}

  private:
    optional<T> value_;
    optional<deploy_failure> failure_;
  };

  // Result of a single deployment step (docker compose invocation).
  //
  // The tail is the end of the redacted combined stdout/stderr output.
  // The exit code is absent if the command didn't run to completion (timed
  // out or failed to start).
  //
  struct step_result
  {
    string name;
    bool ok;
    optional<int> exit_code;
    std::chrono::milliseconds duration;
    string tail;
  };

  using step_results = vector<step_result>;

  // The deployment response envelope. The request succeeded if all the
  // attempted steps succeeded.
  //
  struct deploy_response
  {
    bool ok;
    string stack;
    step_results steps;
    timestamp started_at;
    timestamp finished_at;

    deploy_response (string stack,
                     step_results,
                     timestamp started_at,
                     timestamp finished_at);

    uint16_t
    status () const {return ok ? 200 : 500;}

    // Serialize as:
    //
    // {
    //   "ok": true,
    //   "stack": "web",
    //   "steps": [
    //     {"name": "status", "ok": true, "exit_code": 0,
    //      "duration_ms": 231, "tail": "web\n"},
    //     ...
    //   ],
    //   "started_at": "2024-05-01T10:00:00.123Z",
    //   "finished_at": "2024-05-01T10:00:42.017Z"
    // }
    //
    string
    json () const;
  };

  // The POST /deploy request body.
  //
  // {"stack": "<name>"}
  //
  // The stack is absent if the member is missing, null, false, zero, or an
  // empty string. Integer values are taken verbatim. Throw
  // invalid_json_input if the body is not a valid JSON object and
  // invalid_argument if the stack value has some other type.
  //
  struct deploy_request
  {
    optional<string> stack;

    explicit
    deploy_request (json::parser&);
  };

  // Format the timestamp as UTC ISO 8601 with milliseconds (for example,
  // 2024-05-01T10:00:00.123Z). Throw system_error on conversion failure.
  //
  string
  to_iso8601 (timestamp);
}

#endif // LIBSTACKHOOK_DEPLOY_HXX
