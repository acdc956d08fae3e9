#include <cmath>

#include <libhostlink/units.hxx>

#undef NDEBUG
#include <cassert>

using namespace hostlink;

namespace
{
  bool
  near (double x, double y)
  {
    return std::fabs (x - y) < 1e-9;
  }

  void
  test_factors ()
  {
    static_assert (units::host_to_model_factor () == 0.3048);

    assert (near (units::model_to_host_factor () *
                  units::host_to_model_factor (), 1.0));
  }

  void
  test_conversion ()
  {
    assert (near (units::to_model (1.0), 0.3048));
    assert (near (units::to_host (0.3048), 1.0));
    assert (near (units::to_host (1.0), 3.280839895013123));
    assert (near (units::to_model (units::to_host (12.5)), 12.5));
    assert (units::to_host (0.0) == 0.0);
  }
}

int
main ()
{
  test_factors ();
  test_conversion ();
}
