// file      : web/server/apache/service.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef WEB_SERVER_APACHE_SERVICE_HXX
#define WEB_SERVER_APACHE_SERVICE_HXX

#include <apr_pools.h>   // apr_pool_t
#include <apr_hooks.h>   // APR_HOOK_*

#include <httpd.h>       // request_rec, server_rec, HTTP_*, DECLINED
#include <http_config.h> // module, cmd_parms, ap_hook_*()

#include <memory>  // unique_ptr
#include <string>
#include <cassert>

#include <web/server/module.hxx>
#include <web/server/apache/log.hxx>
#include <web/server/apache/request.hxx>

namespace web
{
  namespace apache
  {
    // Apache module that serves requests with a handler.
    //
    // Each handler configuration option is exposed as the <name>-<option>
    // Apache directive. The directives are only accepted in the main server
    // configuration scope so there is a single set of options per server.
    // The handler is selected for a request by the 'SetHandler <name>'
    // directive in effect for the request location.
    //
    // When an Apache worker process starts, the service makes a copy of the
    // provided handler exemplar (the "worker exemplar") and initializes it
    // with the configuration options. Then, for each request, it copies the
    // worker exemplar to create the "handling instance". Note that since
    // the provided exemplar is never initialized, the handler's copy
    // constructor can tell a worker exemplar copy from a handling instance
    // copy.
    //
    class service: ::module
    {
    public:
      // Note that the handler exemplar is stored by-reference.
      //
      template <typename H>
      service (const std::string& name, H& exemplar)
          : ::module
            {
              STANDARD20_MODULE_STUFF,
              nullptr,
              nullptr,
              nullptr,
              nullptr,
              nullptr,
              &register_hooks<H>,
              AP_MODULE_FLAG_NONE
            },
            name_ (name),
            exemplar_ (exemplar)
      {
        init_directives ();

        // instance<H> () delegates processing from the Apache hook C
        // functions to the service object. This restricts the number of
        // service objects per handler implementation class to one.
        //
        service*& srv (instance<H> ());
        assert (srv == nullptr);
        srv = this;
      }

      ~service ()
      {
        delete [] cmds;
      }

    private:
      template <typename H>
      static service*&
      instance () noexcept
      {
        static service* instance;
        return instance;
      }

      template <typename H>
      static void
      register_hooks (apr_pool_t*) noexcept
      {
        // Called at the end of Apache server configuration parsing.
        //
        ap_hook_post_config (&config_finalizer<H>, NULL, NULL, APR_HOOK_LAST);

        // Called right after an Apache worker process is started.
        //
        ap_hook_child_init (
          &worker_initializer<H>, NULL, NULL, APR_HOOK_LAST);

        // Called for each client request.
        //
        ap_hook_handler (&request_handler<H>, NULL, NULL, APR_HOOK_LAST);
      }

      template <typename H>
      static int
      config_finalizer (apr_pool_t*, apr_pool_t*, apr_pool_t*, server_rec* s)
        noexcept
      {
        instance<H> ()->finalize_config (s);
        return OK;
      }

      template <typename H>
      static void
      worker_initializer (apr_pool_t*, server_rec* s) noexcept
      {
        auto srv (instance<H> ());
        log l (s, srv);
        srv->template init_worker<H> (l);
      }

      template <typename H>
      static int
      request_handler (request_rec* r) noexcept;

    private:
      void
      init_directives ();

      static const char*
      parse_option (cmd_parms* parms, void* conf, const char* args) noexcept;

      void
      finalize_config (server_rec*);

      template <typename H>
      void
      init_worker (log&);

      template <typename H>
      int
      handle (request&, log&) const;

    private:
      std::string name_;
      handler& exemplar_;
      option_descriptions option_descriptions_;

      // Options collected from the configuration directives.
      //
      name_values options_;

      std::unique_ptr<handler> worker_exemplar_;

      bool options_parsed_ = false;
      bool version_logged_ = false;
    };
  }
}

#include <web/server/apache/service.txx>

#endif // WEB_SERVER_APACHE_SERVICE_HXX
