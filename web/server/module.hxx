// file      : web/server/module.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef WEB_SERVER_MODULE_HXX
#define WEB_SERVER_MODULE_HXX

#include <map>
#include <string>
#include <vector>
#include <iosfwd>
#include <cstdint>   // uint16_t, uint64_t
#include <cstddef>   // size_t
#include <utility>   // move()
#include <stdexcept> // runtime_error

#include <libbutl/path.hxx>
#include <libbutl/optional.hxx>

namespace web
{
  using butl::optional;

  // HTTP status code.
  //
  using status_code = std::uint16_t;

  // This exception is used to signal that the request cannot be processed
  // and should be answered with the specified status code and content. By
  // default 400 is returned, which means the request is malformed.
  //
  // If caught by the web server implementation, it will try to return the
  // specified status and content to the client, if possible. It may not be
  // possible if some unbuffered content has already been written, in which
  // case only the status is reported.
  //
  struct invalid_request
  {
    status_code status;
    std::string content;
    std::string type;

    invalid_request (status_code s = 400,
                     std::string c = "",
                     std::string t = "text/plain;charset=utf-8")
        : status (s), content (std::move (c)), type (std::move (t)) {}
  };

  // Exception indicating HTTP request/response sequencing error. For
  // example, trying to change the status code after some content has
  // already been written.
  //
  struct sequence_error: std::runtime_error
  {
    sequence_error (std::string d): std::runtime_error (std::move (d)) {}
  };

  // Map of handler configuration option names to the boolean flag indicating
  // whether the value is expected for the option.
  //
  using option_descriptions = std::map<std::string, bool>;

  struct name_value
  {
    std::string name;
    optional<std::string> value;

    name_value () {}
    name_value (std::string n, optional<std::string> v)
        : name (std::move (n)), value (std::move (v)) {}
  };

  using name_values = std::vector<name_value>;
  using butl::path;

  class request
  {
  public:
    using path_type = web::path;

    virtual
    ~request () = default;

    // HTTP method (GET, POST, etc).
    //
    virtual const std::string&
    method () = 0;

    // Corresponds to abs_path portion of HTTP URL as described in "3.2.2 HTTP
    // URL" of http://tools.ietf.org/html/rfc2616. Returns '/' if no abs_path
    // is present in URL. The path is URL-decoded.
    //
    virtual const path_type&
    path () = 0;

    // Request headers.
    //
    // The implementation may add custom pseudo-headers reflecting additional
    // request options. Such headers should start with ':'. If possible, the
    // implementation should add the following well-known pseudo-headers:
    //
    // :Client-IP - IP address of the connecting client.
    //
    virtual const name_values&
    headers () = 0;

    // Get the stream to read the request content from. If the limit argument
    // is zero, then the content is unlimited. Otherwise the invalid_request
    // exception with the code 413 (payload too large) is thrown when the
    // specified limit is exceeded while reading from the stream.
    //
    virtual std::istream&
    content (std::size_t limit = 0) = 0;
  };

  class response
  {
  public:
    virtual
    ~response () = default;

    // Set status code, content type, and get the stream to write the content
    // to. The content is buffered and only sent once the request handling is
    // complete. If the status code is changed, then the previously written
    // content is discarded.
    //
    virtual std::ostream&
    content (status_code code = 200,
             const std::string& type = "application/json") = 0;
  };

  // Web server log record severity.
  //
  enum class log_level
  {
    error,
    warning,
    info,
    trace
  };

  // A web server logging backend. The handler can use it to log
  // diagnostics that is meant for the web server operator rather than the
  // user.
  //
  class log
  {
  public:
    virtual
    ~log () = default;

    virtual void
    write (const char* msg) = 0;

    // Write a record attributed to the source location and function (any of
    // which can be NULL/zero).
    //
    virtual void
    write (const char* file,
           std::uint64_t line,
           const char* func,
           log_level,
           const char* msg) = 0;
  };

  // The web server creates a new handler instance for each request by
  // copy-initializing it with the handler exemplar. This way we can freely
  // use handler data members without worrying about multi-threading issues
  // and we automatically get started with the initial state for each
  // request. If some rw-data needs to be shared between all the handler
  // instances, then it should be referenced via a shared pointer and
  // protected with appropriate locking.
  //
  class handler
  {
  public:
    virtual
    ~handler () = default;

    // Description of configuration options supported by this handler. Note:
    // should be callable during static initialization.
    //
    virtual option_descriptions
    options () = 0;

    // During startup the web server calls this function on the handler
    // exemplar to log the handler version information.
    //
    virtual void
    version (log&) = 0;

    // During startup the web server calls this function on the handler
    // exemplar passing a list of configuration options. The web server
    // guarantees that only options listed in the map returned by the
    // options() function above can be present. Any exception thrown by this
    // function terminates the web server.
    //
    virtual void
    init (const name_values&, log&) = 0;

    // Return false if decline to handle the request.
    //
    // Any exception other than invalid_request that leaves this function is
    // treated by the web server implementation as an internal server error
    // (500). The exception description is logged but not returned to the
    // client.
    //
    virtual bool
    handle (request&, response&, log&) = 0;
  };
}

#endif // WEB_SERVER_MODULE_HXX
