// file      : mod/services.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <ap_config.h> // AP_MODULE_DECLARE_DATA

#include <web/server/apache/service.hxx>

#include <libstackhook/types.hxx>
#include <libstackhook/utility.hxx>

#include <mod/mod-root.hxx>

static stackhook::root mod;
web::apache::service AP_MODULE_DECLARE_DATA stackhook_module ("stackhook",
                                                              mod);
