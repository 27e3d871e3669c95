// file      : web/server/apache/request.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <web/server/apache/request.hxx>

#include <apr_tables.h>  // apr_table_*, apr_table_elts(), apr_array_header_t
#include <apr_strings.h> // apr_pstrdup()

#include <httpd.h>         // request_rec, HTTP_*, OK
#include <http_protocol.h> // ap_*()

#include <string>
#include <cassert>
#include <utility>   // move()

#include <libbutl/optional.hxx>

using namespace std;
using namespace butl;

namespace web
{
  namespace apache
  {
    request::
    request (request_rec* rec) noexcept
        : rec_ (rec)
    {
      rec_->status = HTTP_OK;
    }

    void request::
    state (request_state s)
    {
      assert (s != request_state::initial);

      if (s == state_)
        return; // Noop.

      if (s < state_)
      {
        // Can't "unwind" irrevocable interaction with Apache API.
        //
        static const char* names[] = {"initial", "reading", "writing"};

        string str ("web::apache::request::state: ");
        str += names[static_cast<size_t> (state_)];
        str += " to ";
        str += names[static_cast<size_t> (s)];

        throw sequence_error (move (str));
      }

      if (s == request_state::reading)
      {
        // Prepare request content for reading.
        //
        int r (ap_setup_client_block (rec_, REQUEST_CHUNKED_DECHUNK));

        if (r != OK)
          throw invalid_request (r);
      }
      else if (state_ == request_state::initial)
      {
        // Discard the request content, if any, before writing the response.
        //
        int r (ap_discard_request_body (rec_));

        if (r != OK)
          throw invalid_request (r);
      }

      state_ = s;
    }

    const string& request::
    method ()
    {
      if (method_.empty ())
      {
        assert (rec_->method != nullptr);
        method_ = rec_->method;
      }

      return method_;
    }

    const path& request::
    path ()
    {
      if (path_.empty ())
      {
        path_ = path_type (rec_->uri); // Is already URL-decoded.

        // Module request handler can not be called if URI is empty.
        //
        assert (!path_.empty ());
      }

      return path_;
    }

    const name_values& request::
    headers ()
    {
      if (headers_ == nullptr)
      {
        headers_.reset (new name_values ());

        const apr_array_header_t* ha (apr_table_elts (rec_->headers_in));
        size_t n (ha->nelts);

        headers_->reserve (n + 1); // One for the custom :Client-IP header.

        auto add = [this] (const char* n, const char* v)
        {
          assert (n != nullptr && v != nullptr);
          headers_->emplace_back (n, optional<string> (v));
        };

        for (auto h (reinterpret_cast<const apr_table_entry_t*> (ha->elts));
             n--; ++h)
          add (h->key, h->val);

        assert (rec_->connection != nullptr);

        add (":Client-IP", rec_->connection->client_ip);
      }

      return *headers_;
    }

    istream& request::
    content (size_t limit)
    {
      if (in_ == nullptr)
      {
        unique_ptr<istreambuf> in_buf (new istreambuf (rec_, *this, limit));

        in_.reset (new istream (in_buf.get ()));
        in_buf_ = move (in_buf);
        in_->exceptions (istream::failbit | istream::badbit);
      }
      else
      {
        assert (in_buf_ != nullptr);

        if (limit != 0)
          in_buf_->limit (limit);
      }

      return *in_;
    }

    ostream& request::
    content (status_code status, const string& type)
    {
      if (state_ >= request_state::writing)
        throw sequence_error ("web::apache::request::content");

      // Discard the previously buffered content if the status changes.
      //
      if (out_ == nullptr || status != rec_->status)
      {
        out_.reset ();
        out_buf_.reset (new stringbuf ());
        out_.reset (new ostream (out_buf_.get ()));
        out_->exceptions (ostream::eofbit | ostream::failbit | ostream::badbit);
      }

      rec_->status = status;

      ap_set_content_type (
        rec_,
        type.empty () ? nullptr : apr_pstrdup (rec_->pool, type.c_str ()));

      return *out_;
    }
  }
}
