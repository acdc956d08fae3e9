#include <libhostlink/model.hxx>

namespace hostlink
{
  core_model::~core_model () = default;
  view_model::~view_model () = default;
  model_factory::~model_factory () = default;
}
