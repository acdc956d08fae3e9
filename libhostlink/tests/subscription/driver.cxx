#include <stdexcept>
#include <vector>

#include <libhostlink/subscription.hxx>

#include <common/fakes.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace hostlink;
using namespace hostlink::test;

namespace
{
  // Test that subscribing twice and unsubscribing once leaves nothing
  // attached.
  //
  void
  test_double_subscribe ()
  {
    fake_host h;
    subscription_registry r (h);

    int calls (0);
    subscription_registry::handler_set hs {
      {host_event::document_opened, [&calls] (const event_args&) {++calls;}}};

    assert (r.subscribe (hs) == 1);
    assert (r.subscribe (hs) == 0);
    assert (h.connected (host_event::document_opened) == 1);

    assert (r.unsubscribe ({host_event::document_opened}) == 1);
    assert (!r.active (host_event::document_opened));
    assert (h.connected (host_event::document_opened) == 0);

    assert (h.fire (host_event::document_opened) == 0);
    assert (calls == 0);
  }

  // Test that an active kind keeps its original handler.
  //
  void
  test_first_handler_wins ()
  {
    fake_host h;
    subscription_registry r (h);

    int first (0), second (0);
    assert (r.add (host_event::view_activated,
                   [&first] (const event_args&) {++first;}));
    assert (!r.add (host_event::view_activated,
                    [&second] (const event_args&) {++second;}));

    assert (h.fire (host_event::view_activated) == 1);
    assert (first == 1);
    assert (second == 0);
  }

  // Test that removal is idempotent.
  //
  void
  test_idempotent_remove ()
  {
    fake_host h;
    subscription_registry r (h);

    assert (!r.remove (host_event::document_closed));

    r.add (host_event::document_closed, [] (const event_args&) {});
    assert (r.remove (host_event::document_closed));
    assert (!r.remove (host_event::document_closed));
    assert (h.handlers.empty ());
  }

  // Test that any call sequence keeps at most one registration per kind.
  //
  void
  test_at_most_one ()
  {
    fake_host h;
    subscription_registry r (h);

    const vector<host_event> es {host_event::view_activating,
                                 host_event::view_activated,
                                 host_event::document_opened,
                                 host_event::document_closing,
                                 host_event::document_closed};

    subscription_registry::handler_set hs;
    for (host_event e: es)
      hs.emplace_back (e, [] (const event_args&) {});

    for (int i (0); i != 16; ++i)
    {
      switch (i % 4)
      {
      case 0: r.subscribe (hs); break;
      case 1: r.subscribe (hs); break;
      case 2: r.unsubscribe ({es[i % es.size ()]}); break;
      case 3: r.remove (es[(i + 1) % es.size ()]); break;
      }

      for (host_event e: es)
      {
        assert (h.connected (e) <= 1);
        assert (h.connected (e) == (r.active (e) ? 1u : 0u));
      }
    }

    r.subscribe (hs);
    assert (r.size () == es.size ());
    assert (r.clear () == es.size ());
    assert (r.size () == 0);
    assert (h.handlers.empty ());
  }

  // Test that the registry detaches everything on destruction.
  //
  void
  test_destruction ()
  {
    fake_host h;

    {
      subscription_registry r (h);
      r.add (host_event::document_opened, [] (const event_args&) {});
      r.add (host_event::document_closing, [] (const event_args&) {});
      assert (h.handlers.size () == 2);
    }

    assert (h.handlers.empty ());
  }

  // Test that destruction survives a host that refuses to disconnect.
  //
  void
  test_destruction_failure ()
  {
    fake_host h;
    capture_cerr c;

    {
      subscription_registry r (h);
      r.add (host_event::view_activated, [] (const event_args&) {});
      r.add (host_event::document_closed, [] (const event_args&) {});
      h.fail_disconnect = true;
    }

    assert (c.count ("warning: unable to unsubscribe from ") == 2);
    assert (c.count ("host is shutting down") == 2);
  }

  // Test that an empty handler is rejected without changing state.
  //
  void
  test_empty_handler ()
  {
    fake_host h;
    subscription_registry r (h);

    bool thrown (false);
    try
    {
      r.add (host_event::document_opened, event_handler ());
    }
    catch (const invalid_argument&)
    {
      thrown = true;
    }

    assert (thrown);
    assert (!r.active (host_event::document_opened));
    assert (h.handlers.empty ());
  }

  // Test that the payload reaches the handler.
  //
  void
  test_payload ()
  {
    fake_host h;
    subscription_registry r (h);

    event_args seen {host_event::idling};
    r.add (host_event::document_closing,
           [&seen] (const event_args& a) {seen = a;});

    h.fire (host_event::document_closing, 42, 7);

    assert (seen.event == host_event::document_closing);
    assert (seen.document == 42);
    assert (seen.view == 7);
  }
}

int
main ()
{
  test_double_subscribe ();
  test_first_handler_wins ();
  test_idempotent_remove ();
  test_at_most_one ();
  test_destruction ();
  test_destruction_failure ();
  test_empty_handler ();
  test_payload ();
}
