#pragma once

#include <libhostlink/types.hxx>

#include <libhostlink/export.hxx>

namespace hostlink
{
  // Text of a captured exception, "unknown exception" if it is not derived
  // from std::exception.
  //
  LIBHOSTLINK_SYMEXPORT string
  describe (const exception_ptr&);

  // Run a step whose failure must not stop the caller. Any exception is
  // written to cerr as a warning and dropped.
  //
  template <typename F>
  void
  best_effort (const char* step, F&& f)
  {
    try
    {
      f ();
    }
    catch (...)
    {
      cerr << "warning: unable to " << step << ": "
           << describe (std::current_exception ()) << endl;
    }
  }
}
