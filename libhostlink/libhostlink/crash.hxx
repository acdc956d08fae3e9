#pragma once

#include <libhostlink/types.hxx>
#include <libhostlink/model.hxx>
#include <libhostlink/context.hxx>
#include <libhostlink/session.hxx>

#include <libhostlink/export.hxx>

namespace hostlink
{
  enum class crash_phase
  {
    idle,      // No crash in this session.
    crashed,   // Crash sequence ran; waiting for a new session.
    recovered  // A new session started after a crash.
  };

  LIBHOSTLINK_SYMEXPORT const char*
  to_string (crash_phase);

  // Handles exceptions that escaped into the host's UI dispatch loop.
  //
  // The first notification in a session reports the crash, prompts the user
  // and forces the view to exit. Later notifications in the same session are
  // only marked handled. Whatever happens, the command button ends up
  // enabled so the user can start over.
  //
  class LIBHOSTLINK_SYMEXPORT crash_recovery
  {
  public:
    explicit
    crash_recovery (context&);

    // Handle an unhandled exception for the given session (which may be
    // null if the view outlived it). Never throws std::exception.
    //
    void
    handle (session*, unhandled_exception&);

    // Notify that a new session was created.
    //
    void
    session_started ();

    crash_phase
    phase () const {return phase_;}

    // Crash signature reported to telemetry.
    //
    static uint64_t
    fingerprint (const string& message, const string& stack);

  private:
    context& ctx_;
    crash_phase phase_ = crash_phase::idle;
  };
}
