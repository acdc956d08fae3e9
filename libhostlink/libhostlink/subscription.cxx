#include <libhostlink/subscription.hxx>

#include <libhostlink/diagnostics.hxx>

namespace hostlink
{
  subscription_registry::subscription_registry (host_application& h)
    : host_ (h)
  {
  }

  subscription_registry::~subscription_registry ()
  {
    // Every slot is released even if the host refuses to disconnect.
    //
    for (size_t i (0); i != host_event_count; ++i)
    {
      host_event e (static_cast<host_event> (i));

      try
      {
        remove (e);
      }
      catch (...)
      {
        cerr << "warning: unable to unsubscribe from " << to_string (e)
             << ": " << describe (std::current_exception ()) << endl;
      }
    }
  }

  bool
  subscription_registry::add (host_event e, event_handler h)
  {
    if (!h)
      throw invalid_argument (string ("empty handler for ") + to_string (e));

    optional<connection>& s (slots_[static_cast<size_t> (e)]);

    if (s)
      return false;

    s = host_.connect (e, move (h));

#if LIBHOSTLINK_DEVELOP
    cerr << "info: subscribed to " << to_string (e) << endl;
#endif

    return true;
  }

  bool
  subscription_registry::remove (host_event e)
  {
    optional<connection>& s (slots_[static_cast<size_t> (e)]);

    if (!s)
      return false;

    // The slot is inactive even if the host fails to disconnect.
    //
    connection c (*s);
    s.reset ();
    host_.disconnect (c);

#if LIBHOSTLINK_DEVELOP
    cerr << "info: unsubscribed from " << to_string (e) << endl;
#endif

    return true;
  }

  bool
  subscription_registry::active (host_event e) const
  {
    return slots_[static_cast<size_t> (e)].has_value ();
  }

  size_t
  subscription_registry::size () const
  {
    size_t n (0);
    for (const optional<connection>& s: slots_)
      if (s)
        ++n;
    return n;
  }

  size_t
  subscription_registry::subscribe (const handler_set& hs)
  {
    size_t n (0);
    for (const auto& h: hs)
      if (add (h.first, h.second))
        ++n;
    return n;
  }

  size_t
  subscription_registry::unsubscribe (const vector<host_event>& es)
  {
    size_t n (0);
    for (host_event e: es)
      if (remove (e))
        ++n;
    return n;
  }

  size_t
  subscription_registry::clear ()
  {
    size_t n (0);
    for (size_t i (0); i != host_event_count; ++i)
      if (remove (static_cast<host_event> (i)))
        ++n;
    return n;
  }
}
