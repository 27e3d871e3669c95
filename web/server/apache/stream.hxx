// file      : web/server/apache/stream.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef WEB_SERVER_APACHE_STREAM_HXX
#define WEB_SERVER_APACHE_STREAM_HXX

#include <httpd.h>         // request_rec, HTTP_*
#include <http_protocol.h> // ap_*()

#include <ios>       // streamsize
#include <vector>
#include <cstring>   // memmove(), size_t
#include <streambuf>
#include <algorithm> // min(), max()

#include <web/server/module.hxx> // invalid_request

namespace web
{
  namespace apache
  {
    // Keeps the state of communication with the client.
    //
    struct stream_state
    {
      // Called by istreambuf when content is about to be read from the
      // client. Can throw invalid_request or sequence_error.
      //
      virtual void
      set_read_state () = 0;
    };

    // Stream buffer reading the request content from the client, failing
    // with the 413 status code if the limit (if non-zero) is exceeded.
    //
    class istreambuf: public std::streambuf
    {
    public:
      istreambuf (request_rec* r,
                  stream_state& s,
                  size_t limit,
                  size_t bufsize = 1024,
                  size_t putback = 1)
          : rec_ (r),
            state_ (s),
            limit_ (limit),
            bufsize_ (std::max (bufsize, (size_t)1)),
            putback_ (std::min (putback, bufsize_ - 1)),
            buf_ (bufsize_)
      {
        char* p (buf_.data () + putback_);
        setg (p, p, p);
      }

      void
      limit (size_t l) noexcept {limit_ = l;}

    protected:
      virtual int_type
      underflow ()
      {
        if (gptr () < egptr ())
          return traits_type::to_int_type (*gptr ());

        if (limit_ != 0 && read_ >= limit_)
          throw invalid_request (HTTP_REQUEST_ENTITY_TOO_LARGE,
                                 "payload too large");

        state_.set_read_state ();

        size_t pb (std::min ((size_t)(gptr () - eback ()), putback_));
        std::memmove (buf_.data () + putback_ - pb, gptr () - pb, pb);

        char* p (buf_.data () + putback_);
        long rb (ap_get_client_block (rec_, p, bufsize_ - putback_));

        if (rb == 0)
          return traits_type::eof ();

        if (rb < 0)
          throw invalid_request (HTTP_REQUEST_TIME_OUT);

        read_ += rb;

        if (limit_ != 0 && read_ > limit_)
          throw invalid_request (HTTP_REQUEST_ENTITY_TOO_LARGE,
                                 "payload too large");

        setg (p - pb, p, p + rb);
        return traits_type::to_int_type (*gptr ());
      }

    private:
      request_rec* rec_;
      stream_state& state_;

      size_t limit_;
      size_t read_ = 0;

      size_t bufsize_;
      size_t putback_;
      std::vector<char> buf_;
    };
  }
}

#endif // WEB_SERVER_APACHE_STREAM_HXX
