// file      : web/server/apache/service.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <web/server/apache/service.hxx>

#include <httpd.h>       // server_rec
#include <http_config.h> // command_rec, cmd_*

#include <memory>    // unique_ptr
#include <string>
#include <cassert>
#include <utility>   // move()
#include <cstring>   // strlen()

#include <libbutl/optional.hxx>

using namespace std;

namespace web
{
  namespace apache
  {
    void service::
    init_directives ()
    {
      assert (cmds == nullptr);

      // Directives share a common name space in the Apache configuration
      // file, so to prevent name clashes the directive name is formed as a
      // combination of the module and option names: <module>-<option>.
      //
      const option_descriptions& od (exemplar_.options ());
      unique_ptr<command_rec[]> directives (new command_rec[od.size () + 1]);
      command_rec* d (directives.get ());

      for (const auto& o: od)
      {
        auto i (
          option_descriptions_.emplace (name_ + "-" + o.first, o.second));
        assert (i.second);

        *d++ =
          {
            i.first->first.c_str (),
            reinterpret_cast<cmd_func> (parse_option),
            this,

            // Only allow directives in the server configuration scope.
            //
            RSRC_CONF,

            // Move away from TAKE1 to be able to handle empty string and
            // no-value.
            //
            RAW_ARGS,

            nullptr
          };
      }

      *d = {nullptr, nullptr, nullptr, 0, RAW_ARGS, nullptr};
      cmds = directives.release ();
    }

    const char* service::
    parse_option (cmd_parms* parms, void*, const char* args) noexcept
    {
      service& srv (*reinterpret_cast<service*> (parms->cmd->cmd_data));

      if (srv.options_parsed_)
      {
        // Apache has started the second pass of its initialization cycle.
        // This time we are parsing for real, so start from scratch.
        //
        srv.options_.clear ();
        srv.options_parsed_ = false;
      }

      assert (parms->server != nullptr);

      if (parms->server->is_virtual)
        return "directive is only allowed in the main server configuration";

      // 'args' is an optionally double-quoted string. It uses double quotes
      // to distinguish empty string from no-value case.
      //
      assert (args != nullptr);

      optional<string> value;
      if (auto l = strlen (args))
        value = l >= 2 && args[0] == '"' && args[l - 1] == '"'
          ? string (args + 1, l - 2)
          : args;

      const char* name (parms->cmd->name);

      auto i (srv.option_descriptions_.find (name));
      assert (i != srv.option_descriptions_.end ());

      // Check that option value presence is expected.
      //
      if (i->second != static_cast<bool> (value))
        return value ? "unexpected value" : "value expected";

      srv.options_.emplace_back (name + srv.name_.length () + 1, move (value));
      return nullptr;
    }

    void service::
    finalize_config (server_rec* s)
    {
      if (!version_logged_)
      {
        log l (s, this);
        exemplar_.version (l);
        version_logged_ = true;
      }

      options_parsed_ = true;
    }
  }
}
