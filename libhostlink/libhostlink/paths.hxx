#pragma once

#include <libhostlink/types.hxx>

#include <libhostlink/export.hxx>

namespace hostlink
{
  // Path-resolution collaborator that the host's library loader consults.
  //
  class LIBHOSTLINK_SYMEXPORT path_registry
  {
  public:
    virtual
    ~path_registry ();

    virtual void
    add_resolution_path (const fs::path&) = 0;

    virtual void
    initialize_core (const fs::path&) = 0;

    virtual void
    add_preload_library (const fs::path&) = 0;

    virtual void
    add_node_directory (const fs::path&) = 0;
  };

  // Search paths derived from the extension module's location.
  //
  // The module is installed in a host-version specific directory whose
  // parent holds the companion resources.
  //
  struct companion_paths
  {
    fs::path module_directory;
    fs::path core_directory;
    vector<fs::path> preload_libraries;
    fs::path node_directory;
  };

  // Throws initialization_error if the module location has no parent
  // directory to walk up to.
  //
  LIBHOSTLINK_SYMEXPORT companion_paths
  resolve_companion_paths (const fs::path& module_location,
                           const vector<string>& preload_libraries);

  // Register the paths in order: resolution path, core directory, preload
  // libraries, node directory.
  //
  // Throws initialization_error if the core directory does not exist.
  //
  LIBHOSTLINK_SYMEXPORT void
  register_companion_paths (path_registry&, const companion_paths&);

  // Location of the shared object containing this library.
  //
  // Throws initialization_error if it cannot be determined.
  //
  LIBHOSTLINK_SYMEXPORT fs::path
  current_module_location ();
}
