#include <libhostlink/paths.hxx>

#include <system_error>

#include <dlfcn.h>

#include <libhostlink/error.hxx>

namespace hostlink
{
  path_registry::~path_registry () = default;

  companion_paths
  resolve_companion_paths (const fs::path& l, const vector<string>& pl)
  {
    fs::path d (l.parent_path ());
    fs::path c (d.parent_path ());

    if (d.empty () || c.empty () || c == d)
      throw initialization_error ("unable to derive companion directory from '" +
                                  l.string () + "'");

    companion_paths r;
    r.module_directory = d;
    r.core_directory = c;
    r.node_directory = d / "nodes";

    for (const string& n: pl)
      r.preload_libraries.push_back (d / n);

    return r;
  }

  void
  register_companion_paths (path_registry& r, const companion_paths& p)
  {
    std::error_code ec;
    if (!fs::is_directory (p.core_directory, ec))
      throw initialization_error ("companion resources directory not found: " +
                                  p.core_directory.string ());

    r.add_resolution_path (p.module_directory);
    r.initialize_core (p.core_directory);

    for (const fs::path& l: p.preload_libraries)
      r.add_preload_library (l);

    r.add_node_directory (p.node_directory);
  }

  fs::path
  current_module_location ()
  {
    // Any address inside this shared object will do.
    //
    Dl_info i;
    if (dladdr (reinterpret_cast<void*> (&current_module_location), &i) == 0 ||
        i.dli_fname == nullptr)
      throw initialization_error ("unable to retrieve module location");

    std::error_code ec;
    fs::path p (fs::canonical (i.dli_fname, ec));

    if (ec)
      throw initialization_error ("unable to resolve module location '" +
                                  string (i.dli_fname) + "': " + ec.message ());

    return p;
  }
}
