#include <string>

// Stand-in for the shape manager shipped with a companion installation.
//
extern "C" __attribute__ ((visibility ("default"))) const char*
hostlink_geometry_factory_path (const char* core, int version)
{
  static std::string r;

  if (version <= 0)
    return nullptr;

  r = std::string (core) + "/geometry/" + std::to_string (version);
  return r.c_str ();
}
