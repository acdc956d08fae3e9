#pragma once

#include <libhostlink/types.hxx>

#include <libhostlink/export.hxx>

namespace hostlink
{
  // Startup failure: companion resources missing or not resolvable.
  //
  // Fatal to the current attach attempt and reported through the entry
  // point's result. Never retried automatically.
  //
  class LIBHOSTLINK_SYMEXPORT initialization_error: public runtime_error
  {
  public:
    using runtime_error::runtime_error;
  };

  // An idle-only operation was invoked outside of the idle context.
  //
  class LIBHOSTLINK_SYMEXPORT idle_affinity_error: public logic_error
  {
  public:
    explicit
    idle_affinity_error (const string& operation);
  };

  // Transaction or deletion failure while removing a marker resource.
  //
  class LIBHOSTLINK_SYMEXPORT resource_cleanup_error: public runtime_error
  {
  public:
    using runtime_error::runtime_error;
  };
}
