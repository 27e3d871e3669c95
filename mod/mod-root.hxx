// file      : mod/mod-root.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef MOD_MOD_ROOT_HXX
#define MOD_MOD_ROOT_HXX

#include <libstackhook/types.hxx>
#include <libstackhook/utility.hxx>

#include <mod/module.hxx>
#include <mod/module-options.hxx>

namespace stackhook
{
  class deploy;
  class admission_control;

  // Dispatch the requests under the root URL path:
  //
  // GET|POST <root>/health
  // POST     <root>/deploy
  // POST     <root>/deploy/<stack>
  //
  // All the requests are subject to the per-client rate limiting. The
  // errors are answered with the JSON body:
  //
  // {"ok": false, "detail": "<reason>"}
  //
  class root: public handler
  {
  public:
    root ();

    // Copy constructible-only type.
    //
    // Create a shallow copy (handling instance) if initialized and a deep
    // copy (context exemplar) otherwise.
    //
    explicit
    root (const root&);

  private:
    virtual bool
    handle (request&, response&);

    virtual const cli::options&
    cli_options () const {return options::root::description ();}

    virtual option_descriptions
    options ();

    virtual void
    init (const name_values&);

    virtual void
    init (cli::scanner&);

    virtual void
    version ();

  private:
    shared_ptr<deploy> deploy_;

    shared_ptr<options::root> options_;

    // Shared by all the handling instances.
    //
    shared_ptr<admission_control> limiter_;

    // Sub-handler the request is dispatched to. Initially is NULL. It is set
    // by handle() to a deep copy of the selected exemplar.
    //
    unique_ptr<handler> handler_;
  };
}

#endif // MOD_MOD_ROOT_HXX
