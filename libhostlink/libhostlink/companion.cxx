#include <libhostlink/companion.hxx>

#include <dlfcn.h>

#include <libhostlink/error.hxx>

namespace hostlink
{
  namespace
  {
    using factory_path_fn = const char* (*) (const char*, int);

    string
    last_error ()
    {
      const char* e (dlerror ());
      return e != nullptr ? e : "unknown error";
    }
  }

  companion_resolver::~companion_resolver () = default;

  shared_library_resolver::shared_library_resolver (string l, string s)
    : library_ (move (l)),
      symbol_ (move (s))
  {
  }

  shared_library_resolver::~shared_library_resolver ()
  {
    if (handle_ != nullptr)
      dlclose (handle_);
  }

  string
  shared_library_resolver::geometry_factory_path (const fs::path& c, int v)
  {
    fs::path p (c / library_);

    if (handle_ == nullptr)
    {
      handle_ = dlopen (p.c_str (), RTLD_NOW | RTLD_LOCAL);

      if (handle_ == nullptr)
        throw initialization_error ("unable to load " + p.string () + ": " +
                                    last_error ());
    }

    // Clear any stale error before the lookup.
    //
    dlerror ();
    void* f (dlsym (handle_, symbol_.c_str ()));

    if (f == nullptr)
      throw initialization_error ("unable to find " + symbol_ + " in " +
                                  p.string () + ": " + last_error ());

    const char* r (reinterpret_cast<factory_path_fn> (f) (c.c_str (), v));

    if (r == nullptr || *r == '\0')
      throw initialization_error ("no geometry factory found in " +
                                  c.string ());

    return r;
  }
}
