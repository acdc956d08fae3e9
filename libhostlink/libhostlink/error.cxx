#include <libhostlink/error.hxx>

namespace hostlink
{
  idle_affinity_error::idle_affinity_error (const string& o)
    : logic_error (o + " must run in the idle context")
  {
  }
}
