#pragma once

#include <libhostlink/types.hxx>
#include <libhostlink/model.hxx>

#include <libhostlink/export.hxx>

namespace hostlink
{
  struct crash_state
  {
    bool handled = false;
    string message;
  };

  // Live state of one extension run, from a successful entry point
  // invocation until the view is closed.
  //
  // A session owns the core and view models. The view model can only be
  // attached together with (or after) a core model and is always destroyed
  // first. Crash state starts fresh with every session.
  //
  class LIBHOSTLINK_SYMEXPORT session
  {
  public:
    session () = default;
    ~session ();

    session (const session&) = delete;
    session& operator= (const session&) = delete;

    // Attach the models. Throws std::invalid_argument if a view model is
    // given without a core model or if models are already attached.
    //
    void
    attach (unique_ptr<core_model>, unique_ptr<view_model> = nullptr);

    // Attach the view model to an already attached core model.
    //
    void
    attach (unique_ptr<view_model>);

    // Destroy the models, view model first. Safe to call repeatedly.
    //
    void
    detach ();

    bool
    attached () const {return core_ != nullptr;}

    core_model*
    core () const {return core_.get ();}

    view_model*
    view () const {return view_.get ();}

    crash_state crash;

    bool initialized_core = false;
    bool application_events_subscribed = false;

  private:
    unique_ptr<core_model> core_;
    unique_ptr<view_model> view_;
  };
}
