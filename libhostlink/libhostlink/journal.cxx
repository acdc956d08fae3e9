#include <libhostlink/journal.hxx>

#include <cctype>
#include <charconv>
#include <istream>
#include <fstream>
#include <thread>

#include <unistd.h>

using namespace std;

namespace hostlink
{
  namespace
  {
    bool
    traced ()
    {
      ifstream is ("/proc/self/status");
      return tracer_pid (is).value_or (0) != 0;
    }
  }

  optional<string>
  journal_value (const journal_data& j, const string& k)
  {
    auto i (j.find (k));
    return i != j.end () ? optional<string> (i->second) : nullopt;
  }

  optional<bool>
  parse_flag (const string& v)
  {
    size_t b (v.find_first_not_of (" \t"));
    size_t e (v.find_last_not_of (" \t"));

    if (b == string::npos)
      return nullopt;

    string s (v.substr (b, e - b + 1));
    for (char& c: s)
      c = static_cast<char> (tolower (static_cast<unsigned char> (c)));

    if (s == "true" || s == "yes" || s == "on" || s == "1")
      return true;

    if (s == "false" || s == "no" || s == "off" || s == "0")
      return false;

    return nullopt;
  }

  optional<long>
  tracer_pid (istream& is)
  {
    const string k ("TracerPid:");

    for (string l; getline (is, l); )
    {
      if (l.compare (0, k.size (), k) != 0)
        continue;

      size_t b (l.find_first_not_of (" \t", k.size ()));

      if (b == string::npos)
        return nullopt;

      long r (0);
      const char* e (l.data () + l.size ());
      from_chars_result fr (from_chars (l.data () + b, e, r));

      if (fr.ec != errc () || fr.ptr != e)
        return nullopt;

      return r;
    }

    return nullopt;
  }

  bool
  wait_for_debugger (chrono::milliseconds t)
  {
    cerr << "info: waiting for debugger to attach to process " << getpid ()
         << endl;

    const auto deadline (chrono::steady_clock::now () + t);

    while (!traced ())
    {
      if (chrono::steady_clock::now () >= deadline)
      {
        cerr << "warning: no debugger attached" << endl;
        return false;
      }

      this_thread::sleep_for (chrono::milliseconds (100));
    }

    return true;
  }
}
