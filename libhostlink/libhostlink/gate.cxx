#include <libhostlink/gate.hxx>

#include <libhostlink/error.hxx>
#include <libhostlink/paths.hxx>
#include <libhostlink/companion.hxx>

namespace hostlink
{
  initialization_gate::initialization_gate (initialization_options o)
    : options_ (move (o))
  {
  }

  const start_configuration&
  initialization_gate::initialize_once (context& ctx)
  {
    if (config_)
      return *config_;

    fs::path l (options_.module_location.empty ()
                ? current_module_location ()
                : options_.module_location);

    companion_paths p (resolve_companion_paths (l, options_.preload_libraries));
    register_companion_paths (ctx.paths, p);

    start_configuration c;
    c.core_path = p.core_directory;
    c.geometry_factory_path =
      ctx.companion.geometry_factory_path (p.core_directory,
                                           options_.geometry_version);

#if LIBHOSTLINK_DEVELOP
    cerr << "info: core path " << c.core_path << ", geometry factory "
         << c.geometry_factory_path << endl;
#endif

    config_ = move (c);
    return *config_;
  }

  const start_configuration&
  initialization_gate::configuration () const
  {
    if (!config_)
      throw logic_error ("extension is not initialized");

    return *config_;
  }
}
