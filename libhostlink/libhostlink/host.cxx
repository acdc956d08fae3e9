#include <libhostlink/host.hxx>

#include <regex>

namespace hostlink
{
  const char*
  to_string (host_event e)
  {
    switch (e)
    {
    case host_event::view_activating:  return "view-activating";
    case host_event::view_activated:   return "view-activated";
    case host_event::document_opened:  return "document-opened";
    case host_event::document_closing: return "document-closing";
    case host_event::document_closed:  return "document-closed";
    case host_event::idling:           return "idling";
    }

    return "unknown";
  }

  string
  host_context (const string& n)
  {
    static const std::regex words (
      R"(\b(Autodesk |Structure |MEP |Architecture )\b)");

    string r (std::regex_replace (n, words, ""));

    if (r == "Vasari")
      r = "Vasari 2014";

    return r;
  }

  transaction::~transaction () = default;
  document::~document () = default;
  host_application::~host_application () = default;
  command_button::~command_button () = default;
  telemetry::~telemetry () = default;
}
