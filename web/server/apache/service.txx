// file      : web/server/apache/service.txx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <httpd.h>    // APEXIT_CHILDSICK
#include <http_log.h> // APLOG_*

#include <cstdlib>   // exit()
#include <exception>

namespace web
{
  namespace apache
  {
    template <typename H>
    void service::
    init_worker (log& l)
    {
      const std::string func_name (
        "web::apache::service<" + name_ + ">::init_worker");

      try
      {
        const H* exemplar (dynamic_cast<const H*> (&exemplar_));
        assert (exemplar != nullptr);

        worker_exemplar_.reset (new H (*exemplar));
        worker_exemplar_->init (options_, l);

        // Options are not needed anymore. Free up the space.
        //
        options_.clear ();
      }
      catch (const std::exception& e)
      {
        l.write (nullptr, 0, func_name.c_str (), APLOG_EMERG, e.what ());

        // Terminate the worker process. APEXIT_CHILDSICK makes the root
        // process limit the rate of forking new workers until the situation
        // is resolved. If no worker can be started at all, then the root
        // process either terminates or keeps retrying, depending on the MPM.
        //
        std::exit (APEXIT_CHILDSICK);
      }
      catch (...)
      {
        l.write (nullptr, 0, func_name.c_str (), APLOG_EMERG, "unknown error");
        std::exit (APEXIT_CHILDSICK);
      }
    }

    template <typename H>
    int service::
    request_handler (request_rec* r) noexcept
    {
      auto srv (instance<H> ());
      if (!r->handler || srv->name_ != r->handler) return DECLINED;

      request rq (r);
      log lg (r->server, srv);
      return srv->template handle<H> (rq, lg);
    }

    template <typename H>
    int service::
    handle (request& rq, log& lg) const
    {
      static const std::string func_name (
        "web::apache::service<" + name_ + ">::handle");

      try
      {
        assert (worker_exemplar_ != nullptr);

        const H* e (dynamic_cast<const H*> (worker_exemplar_.get ()));
        assert (e != nullptr);

        H h (*e);

        if (static_cast<handler&> (h).handle (rq, rq, lg))
          return rq.flush ();

        if (rq.state () == request_state::initial)
          return DECLINED;

        lg.write (nullptr, 0, func_name.c_str (), APLOG_ERR,
                  "handling declined being partially executed");
      }
      catch (const invalid_request& e)
      {
        if (!e.content.empty () && rq.state () < request_state::writing)
        {
          try
          {
            rq.content (e.status, e.type) << e.content;
            return rq.flush ();
          }
          catch (const std::exception& e)
          {
            lg.write (nullptr, 0, func_name.c_str (), APLOG_ERR, e.what ());
          }
        }

        return e.status;
      }
      catch (const std::exception& e)
      {
        // Note that the description is not returned to the client.
        //
        lg.write (nullptr, 0, func_name.c_str (), APLOG_ERR, e.what ());
      }
      catch (...)
      {
        lg.write (nullptr, 0, func_name.c_str (), APLOG_ERR, "unknown error");
      }

      return HTTP_INTERNAL_SERVER_ERROR;
    }
  }
}
