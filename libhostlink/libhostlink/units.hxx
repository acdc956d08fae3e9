#pragma once

// Conversion between the host's internal length unit (feet) and the model's
// (meters). Both scales are fixed.
//
namespace hostlink
{
  namespace units
  {
    constexpr double meters_per_foot (0.3048);

    // Factor that takes a model length to host units.
    //
    constexpr double
    model_to_host_factor ()
    {
      return 1.0 / meters_per_foot;
    }

    constexpr double
    host_to_model_factor ()
    {
      return meters_per_foot;
    }

    constexpr double
    to_host (double meters)
    {
      return meters * model_to_host_factor ();
    }

    constexpr double
    to_model (double feet)
    {
      return feet * host_to_model_factor ();
    }
  }
}
