#pragma once

#include <libhostlink/types.hxx>
#include <libhostlink/model.hxx>
#include <libhostlink/context.hxx>

#include <libhostlink/export.hxx>

namespace hostlink
{
  struct initialization_options
  {
    // Location of the extension module. If empty, the location of the
    // loaded libhostlink is used.
    //
    fs::path module_location;

    // Libraries next to the module that the host should load up front.
    //
    vector<string> preload_libraries;

    // Geometry kernel version requested from the companion resolver.
    //
    int geometry_version = 220;
  };

  // One-time startup of the extension within a host process.
  //
  // The first successful initialize_once() registers the companion paths and
  // resolves the start configuration. Later calls return the recorded
  // configuration without repeating any of it. A failed call leaves the gate
  // uninitialized.
  //
  class LIBHOSTLINK_SYMEXPORT initialization_gate
  {
  public:
    explicit
    initialization_gate (initialization_options);

    // Throws initialization_error.
    //
    const start_configuration&
    initialize_once (context&);

    bool
    initialized () const {return config_.has_value ();}

    // Throws std::logic_error if not initialized.
    //
    const start_configuration&
    configuration () const;

  private:
    initialization_options options_;
    optional<start_configuration> config_;
  };
}
