#include <chrono>
#include <sstream>
#include <string>

#include <libhostlink/journal.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace hostlink;

namespace
{
  // Test recognized flag spellings.
  //
  void
  test_parse_flag ()
  {
    for (const char* v: {"true", "True", "YES", "on", "1", "  true\t"})
      assert (parse_flag (v) == true);

    for (const char* v: {"false", "No", "OFF", "0", " false "})
      assert (parse_flag (v) == false);

    for (const char* v: {"", "   ", "maybe", "10", "t r u e"})
      assert (!parse_flag (v));
  }

  // Test lookup of journal entries.
  //
  void
  test_journal_value ()
  {
    journal_data j {{"dynPath", "/tmp/graph.dyn"}, {"debug", ""}};

    assert (journal_value (j, "dynPath") == "/tmp/graph.dyn");
    assert (journal_value (j, "debug") == "");
    assert (!journal_value (j, "DynPath"));
    assert (!journal_value ({}, "debug"));
  }

  // Test tracer detection from a status listing, including malformed ones.
  //
  void
  test_tracer_pid ()
  {
    auto pid = [] (const string& s)
    {
      istringstream is (s);
      return tracer_pid (is);
    };

    assert (pid ("Name:\tdriver\nTracerPid:\t0\nUid:\t0\n") == 0);
    assert (pid ("State:\tS (sleeping)\nTracerPid:\t4242\n") == 4242);
    assert (pid ("TracerPid:  17") == 17);

    assert (!pid ("Name:\tdriver\n"));
    assert (!pid ("TracerPid:\n"));
    assert (!pid ("TracerPid:\tgdb\n"));
    assert (!pid ("TracerPid:\t12x\n"));
    assert (!pid ("TracerPid:\t99999999999999999999999\n"));
  }

  // Test that an expired wait reports no debugger.
  //
  void
  test_wait_for_debugger ()
  {
    assert (!wait_for_debugger (chrono::milliseconds (0)));
  }
}

int
main ()
{
  test_parse_flag ();
  test_journal_value ();
  test_tracer_pid ();
  test_wait_for_debugger ();
}
