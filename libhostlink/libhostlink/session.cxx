#include <libhostlink/session.hxx>

namespace hostlink
{
  session::~session ()
  {
    detach ();
  }

  void
  session::attach (unique_ptr<core_model> c, unique_ptr<view_model> v)
  {
    if (c == nullptr)
      throw invalid_argument ("core model is required");

    if (core_ != nullptr)
      throw invalid_argument ("session models already attached");

    core_ = move (c);
    view_ = move (v);
  }

  void
  session::attach (unique_ptr<view_model> v)
  {
    if (core_ == nullptr)
      throw invalid_argument ("view model requires a core model");

    if (view_ != nullptr)
      throw invalid_argument ("view model already attached");

    view_ = move (v);
  }

  void
  session::detach ()
  {
    // The view model refers to the core model.
    //
    view_.reset ();
    core_.reset ();
  }
}
