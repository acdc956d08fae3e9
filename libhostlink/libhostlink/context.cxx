#include <libhostlink/context.hxx>

namespace hostlink
{
  context::context (host_application& h,
                    command_button& b,
                    telemetry& t,
                    path_registry& p,
                    companion_resolver& c,
                    model_factory& f)
    : host (h),
      button (b),
      tel (t),
      paths (p),
      companion (c),
      factory (f)
  {
  }
}
