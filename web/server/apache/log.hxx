// file      : web/server/apache/log.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef WEB_SERVER_APACHE_LOG_HXX
#define WEB_SERVER_APACHE_LOG_HXX

#include <httpd.h>       // request_rec, server_rec
#include <http_log.h>
#include <http_config.h> // module

#include <cstdint>   // uint64_t
#include <algorithm> // min()

#include <web/server/module.hxx>

namespace web
{
  namespace apache
  {
    class log: public web::log
    {
    public:
      log (server_rec* s, const ::module* m) noexcept
          : server_ (s), module_ (m) {}

      virtual void
      write (const char* msg)
      {
        write (nullptr, 0, nullptr, APLOG_ERR, msg);
      }

      // Use APLOG_INFO (rather than APLOG_TRACE1) for the trace records not
      // to have to enable the module-unrelated tracing in Apache
      // configuration to see them.
      //
      virtual void
      write (const char* file,
             std::uint64_t line,
             const char* func,
             log_level l,
             const char* msg)
      {
        static const int levels[] = {
          APLOG_ERR, APLOG_WARNING, APLOG_INFO, APLOG_INFO};

        write (file, line, func, levels[static_cast<size_t> (l)], msg);
      }

      // Apache-specific interface.
      //
      void
      write (const char* file,
             std::uint64_t line,
             const char* func,
             int level,
             const char* msg) const noexcept
      {
        // Skip file/line placeholder from log line.
        //
        if (file != nullptr && *file == '\0')
          file = nullptr;

        level = std::min (level, APLOG_TRACE8);

        if (func != nullptr)
          ap_log_error (file, line, module_->module_index, level, 0, server_,
                        "[%s]: %s", func, msg);
        else
          ap_log_error (file, line, module_->module_index, level, 0, server_,
                        ": %s", msg);
      }

    private:
      server_rec* server_;
      const ::module* module_; // Apache module.
    };
  }
}

#endif // WEB_SERVER_APACHE_LOG_HXX
