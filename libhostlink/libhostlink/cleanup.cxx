#include <libhostlink/cleanup.hxx>

#include <libhostlink/error.hxx>
#include <libhostlink/diagnostics.hxx>

namespace hostlink
{
  marker_cleaner::marker_cleaner (context& c, idle_scheduler& s)
    : ctx_ (c),
      sched_ (s)
  {
  }

  bool
  marker_cleaner::schedule (session& s, function<void (exception_ptr)> cf)
  {
    view_model* vm (s.view ());

    if (vm == nullptr)
      return false;

    resource_id& m (vm->visualization ().marker);

    if (!m.valid ())
      return false;

    resource_id id (m);
    m = resource_id::invalid ();

    sched_.schedule_for_execution (
      scheduled_task {[this, id] () {erase (id);}, move (cf)});

#if LIBHOSTLINK_DEVELOP
    cerr << "info: scheduled deletion of marker " << id.value () << endl;
#endif

    return true;
  }

  void
  marker_cleaner::erase (resource_id id)
  {
    sched_.require_idle_context ("marker deletion");

    document* d (ctx_.host.active_document ());

    if (d == nullptr || !id.valid ())
      return;

    string what ("unable to delete marker " +
                 std::to_string (id.value ()));

    unique_ptr<transaction> t;
    try
    {
      t = d->start_transaction ("Delete marker");
    }
    catch (...)
    {
      throw resource_cleanup_error (
        what + ": " + describe (std::current_exception ()));
    }

    if (t == nullptr)
      throw resource_cleanup_error (what + ": no transaction");

    string error;

    try
    {
      d->erase (id);
    }
    catch (...)
    {
      error = describe (std::current_exception ());
    }

    // Close the transaction whatever happened to the deletion.
    //
    try
    {
      t->commit ();
    }
    catch (...)
    {
      error += (error.empty () ? "" : "; ") + string ("commit: ") +
               describe (std::current_exception ());
    }

    if (!error.empty ())
      throw resource_cleanup_error (what + ": " + error);
  }
}
