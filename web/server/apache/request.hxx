// file      : web/server/apache/request.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef WEB_SERVER_APACHE_REQUEST_HXX
#define WEB_SERVER_APACHE_REQUEST_HXX

#include <httpd.h> // request_rec, HTTP_*, OK

#include <memory>  // unique_ptr
#include <string>
#include <sstream> // stringbuf
#include <istream>
#include <ostream>

#include <web/server/module.hxx>
#include <web/server/apache/stream.hxx>

namespace web
{
  namespace apache
  {
    // The state of the request processing, reflecting an interaction with
    // Apache API. Any state different from the initial one means that some
    // irrevocable interaction has happened. The state may only advance.
    //
    enum class request_state
    {
      // The request line and headers are parsed by Apache.
      //
      initial,

      // Reading the request content.
      //
      reading,

      // Writing the response content.
      //
      writing
    };

    class request: public web::request,
                   public web::response,
                   public stream_state
    {
      friend class service;

      request (request_rec* rec) noexcept;

      request_state
      state () const noexcept {return state_;}

      // Send the buffered response content if present. The returned value
      // should be passed to Apache API on request handler exit.
      //
      int
      flush ();

      // web::request interface.
      //
      virtual const std::string&
      method ();

      virtual const path_type&
      path ();

      virtual const name_values&
      headers ();

      virtual std::istream&
      content (std::size_t limit = 0);

      // web::response interface.
      //
      status_code
      status () const noexcept {return rec_->status;}

      virtual std::ostream&
      content (status_code, const std::string& type);

    private:
      // Advance the request processing state. Noop if the new state is equal
      // to the current one. Throw sequence_error if the new state is less
      // than the current one. Can throw invalid_request if the HTTP request
      // is malformed.
      //
      void
      state (request_state);

      virtual void
      set_read_state () {state (request_state::reading);}

    private:
      request_rec* rec_;
      request_state state_ = request_state::initial;

      std::string method_;
      path_type path_;

      std::unique_ptr<name_values> headers_;

      std::unique_ptr<istreambuf> in_buf_;
      std::unique_ptr<std::istream> in_;

      std::unique_ptr<std::stringbuf> out_buf_;
      std::unique_ptr<std::ostream> out_;
    };
  }
}

#include <web/server/apache/request.ixx>

#endif // WEB_SERVER_APACHE_REQUEST_HXX
