#include <string>

#include <libhostlink/host.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace hostlink;

namespace
{
  // Test that vendor and discipline words are stripped.
  //
  void
  test_host_context ()
  {
    assert (host_context ("Autodesk Revit 2015") == "Revit 2015");
    assert (host_context ("Autodesk Revit Architecture 2014") == "Revit 2014");
    assert (host_context ("Autodesk Revit Structure 2014") == "Revit 2014");
    assert (host_context ("Autodesk Revit MEP 2013") == "Revit 2013");
    assert (host_context ("Revit 2016") == "Revit 2016");

    // Only whole words followed by another word are removed.
    //
    assert (host_context ("Revit Architecture") == "Revit Architecture");
    assert (host_context ("XAutodesk Revit") == "XAutodesk Revit");
    assert (host_context ("") == "");
  }

  // Test the yearless Vasari release.
  //
  void
  test_vasari ()
  {
    assert (host_context ("Autodesk Vasari") == "Vasari 2014");
    assert (host_context ("Vasari") == "Vasari 2014");
    assert (host_context ("Autodesk Vasari 2013") == "Vasari 2013");
  }

  void
  test_resource_id ()
  {
    static_assert (!resource_id ().valid ());
    static_assert (resource_id::invalid () == resource_id ());
    static_assert (resource_id (0).valid ());

    assert (resource_id (42).value () == 42);
  }

  void
  test_event_names ()
  {
    assert (string (to_string (host_event::document_opened)) ==
            "document-opened");
    assert (string (to_string (host_event::idling)) == "idling");
  }
}

int
main ()
{
  test_host_context ();
  test_vasari ();
  test_resource_id ();
  test_event_names ();
}
