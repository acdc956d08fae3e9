#include <libhostlink/diagnostics.hxx>

namespace hostlink
{
  string
  describe (const exception_ptr& e)
  {
    if (e == nullptr)
      return "no exception";

    try
    {
      std::rethrow_exception (e);
    }
    catch (const exception& x)
    {
      return x.what ();
    }
    catch (...)
    {
      return "unknown exception";
    }
  }
}
