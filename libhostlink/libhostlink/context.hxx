#pragma once

#include <libhostlink/types.hxx>

#include <libhostlink/export.hxx>

namespace hostlink
{
  // Forward declarations
  //
  class host_application;
  class command_button;
  class telemetry;
  class path_registry;
  class companion_resolver;
  class model_factory;

  // Host collaborators shared by every component.
  //
  // Note that context should always have reference semantics. That is, it must
  // never own the lifecycle of the collaborators it points to. They belong to
  // the host integration and outlive the extension.
  //
  struct LIBHOSTLINK_SYMEXPORT context
  {
    host_application& host;
    command_button& button;
    telemetry& tel;
    path_registry& paths;
    companion_resolver& companion;
    model_factory& factory;

    context (host_application&,
             command_button&,
             telemetry&,
             path_registry&,
             companion_resolver&,
             model_factory&);
  };
}
