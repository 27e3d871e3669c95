// file      : mod/mod-root.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <mod/mod-root.hxx>

#include <time.h> // tzset()

#include <cerrno>
#include <cstdlib> // strtoull()
#include <sstream>

#include <libbutl/utility.hxx> // getenv()
#include <libbutl/version.hxx> // LIBBUTL_VERSION_ID

#include <libstackhook/deploy.hxx> // json_error()

#include <mod/utility.hxx>
#include <mod/mod-deploy.hxx>
#include <mod/rate-limiter.hxx>

using namespace std;
using namespace butl;
using namespace stackhook::cli;

namespace stackhook
{
  root::
  root ()
      : deploy_ (make_shared<deploy> ())
  {
  }

  root::
  root (const root& r)
      : handler (r),

        // Deep/shallow-copy sub-handlers depending on whether this is an
        // exemplar/handler.
        //
        deploy_ (
          r.initialized_
          ? r.deploy_
          : make_shared<deploy> (*r.deploy_)),
        options_ (
          r.initialized_
          ? r.options_
          : nullptr),
        limiter_ (
          r.initialized_
          ? r.limiter_
          : nullptr)
  {
  }

  // Return amalgamation of root and all its sub-handlers option
  // descriptions.
  //
  option_descriptions root::
  options ()
  {
    option_descriptions r (handler::options ());
    append (r, deploy_->options ());
    return r;
  }

  // Initialize sub-handlers and parse own configuration options.
  //
  void root::
  init (const name_values& v)
  {
    auto sub_init = [this, &v] (handler& m, const char* name)
    {
      // Initialize sub-handler. Intercept exception handling to add
      // sub-handler attribution.
      //
      try
      {
        m.init (filter (v, m.options ()), *log_);
      }
      catch (const std::exception& e)
      {
        // Any exception thrown by this function terminates the web server.
        // The only sensible way to handle them is to log the error prior
        // terminating, so we reduce all of them to a single type.
        //
        ostringstream os;
        os << name << ": " << e;
        throw runtime_error (os.str ());
      }
    };

    sub_init (*deploy_, "deploy");

    // Parse own configuration options.
    //
    handler::init (filter (v, convert (options::root::description ())));
  }

  void root::
  init (scanner& s)
  {
    HANDLER_DIAG;

    options_ = make_shared<options::root> (
      s, unknown_mode::fail, unknown_mode::fail);

    if (options_->root ().empty ())
      options_->root (dir_path ("/"));

    if (!options_->rate_limit_specified ())
    {
      if (optional<string> v = butl::getenv ("RATE_LIMIT_PER_MIN"))
      {
        const char* b (v->c_str ());
        char* e (nullptr);
        errno = 0; // We must clear it according to POSIX.
        unsigned long long n (strtoull (b, &e, 10)); // Can't throw.

        if (*b == '\0' || *b == '-' || *e != '\0' || errno == ERANGE)
          fail << "invalid RATE_LIMIT_PER_MIN environment variable value '"
               << *v << "'";

        options_->rate_limit (static_cast<size_t> (n));
      }
    }

    // Note that the limiter is shared by all the handling instances
    // (shallow copies of this exemplar).
    //
    limiter_ = make_shared<sliding_window_limiter> (options_->rate_limit ());

    // To use libbutl timestamp printing functions later on (specifically in
    // sub-handlers, while handling requests).
    //
    tzset ();
  }

  bool root::
  handle (request& rq, response& rs)
  {
    HANDLER_DIAG;

    const dir_path& root (options_->root ());

    const path& rpath (rq.path ());
    if (!rpath.sub (root))
      return false;

    path lpath (rpath.leaf (root));

    auto reject = [] (status_code s, const char* d)
    {
      throw invalid_request (s, json_error (d), "application/json");
    };

    // Admit the request.
    //
    {
      string client ("unknown");
      for (const name_value& h: rq.headers ())
      {
        if (h.name == ":Client-IP" && h.value && !h.value->empty ())
          client = *h.value;
      }

      if (!limiter_->admit (client, system_clock::now ()))
      {
        l1 ([&]{trace << "client " << client << " exceeded rate limit";});

        reject (429, "rate limit exceeded");
      }
    }

    // Delegate the request handling to the selected sub-handler. Intercept
    // exception handling to add sub-handler attribution and to make sure
    // all the errors are answered with the JSON body.
    //
    auto handle = [&rq, &rs, &error, this] (const char* nm)
    {
      try
      {
        return handler_->handle (rq, rs, *log_);
      }
      catch (const invalid_request& e)
      {
        if (e.type == "application/json")
          throw;

        // Request transport errors (payload too large, etc).
        //
        throw invalid_request (
          e.status,
          json_error (!e.content.empty () ? e.content : "invalid request"),
          "application/json");
      }
      catch (const std::exception& e)
      {
        // Log the error message but don't disclose it to the client. Note
        // that the server_error exception is handled internally by the
        // handler::handle() function call.
        //
        error << log_event ("error",
                            [nm, &e] (json::buffer_serializer& s)
                            {
                              s.member ("handler", nm);
                              s.member ("error", e.what ());
                            });

        throw invalid_request (500,
                               json_error ("internal server error"),
                               "application/json");
      }
    };

    const string& method (rq.method ());

    path::iterator i (lpath.begin ());

    if (i != lpath.end ())
    {
      const string& f (*i++);

      if (f == "health" && i == lpath.end ())
      {
        if (method != "GET" && method != "POST")
          reject (405, "method not allowed");

        string b;
        json::buffer_serializer s (b, 0 /* indentation */);

        s.begin_object ();
        s.member ("status", "ok");
        s.end_object ();

        rs.content (200, "application/json") << b;
        return true;
      }
      else if (f == "deploy")
      {
        // The optional single stack name component.
        //
        optional<string> stack;

        if (i != lpath.end ())
        {
          stack = *i++;

          if (i != lpath.end ())
            reject (404, "not found");
        }

        if (method != "POST")
          reject (405, "method not allowed");

        unique_ptr<deploy> d (new deploy (*deploy_));
        d->stack = move (stack);
        handler_ = move (d);

        return handle ("deploy");
      }
    }

    reject (404, "not found");
    return true; // Never reached.
  }

  void root::
  version ()
  {
    HANDLER_DIAG;

    info << "module " << LIBSTACKHOOK_VERSION_ID
         << ", libbutl " << LIBBUTL_VERSION_ID;
  }
}
