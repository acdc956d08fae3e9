#pragma once

#include <libhostlink/types.hxx>

#include <libhostlink/export.hxx>

namespace hostlink
{
  // Resolves where the geometry kernel lives for a companion installation.
  //
  class LIBHOSTLINK_SYMEXPORT companion_resolver
  {
  public:
    virtual
    ~companion_resolver ();

    // Throws initialization_error on failure.
    //
    virtual string
    geometry_factory_path (const fs::path& core_directory, int version) = 0;
  };

  // Resolver backed by the shape manager library shipped in the companion
  // directory.
  //
  // The library is opened with dlopen() and must export
  //
  //   extern "C" const char* <symbol> (const char* core_directory, int version);
  //
  // returning the factory path, or nullptr if there is none. The library
  // stays loaded for the lifetime of the resolver.
  //
  class LIBHOSTLINK_SYMEXPORT shared_library_resolver: public companion_resolver
  {
  public:
    explicit
    shared_library_resolver (
      string library = "libshapemanager.so",
      string symbol = "hostlink_geometry_factory_path");

    ~shared_library_resolver () override;

    shared_library_resolver (const shared_library_resolver&) = delete;
    shared_library_resolver&
    operator= (const shared_library_resolver&) = delete;

    string
    geometry_factory_path (const fs::path&, int) override;

  private:
    string library_;
    string symbol_;
    void* handle_ = nullptr;
  };
}
