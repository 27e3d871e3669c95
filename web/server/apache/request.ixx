// file      : web/server/apache/request.ixx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <http_protocol.h> // ap_*()

namespace web
{
  namespace apache
  {
    inline int request::
    flush ()
    {
      if (out_buf_ != nullptr)
      {
        std::string s (out_buf_->str ());

        if (!s.empty ())
        {
          try
          {
            state (request_state::writing);

            if (ap_rwrite (s.c_str (), s.length (), rec_) < 0)
              rec_->status = HTTP_REQUEST_TIME_OUT;
          }
          catch (const invalid_request& e)
          {
            rec_->status = e.status;
          }
        }

        out_.reset ();
        out_buf_.reset ();
      }

      return rec_->status == HTTP_OK || state_ >= request_state::writing
        ? OK
        : rec_->status;
    }
  }
}
