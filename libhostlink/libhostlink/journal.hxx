#pragma once

#include <chrono>
#include <iosfwd>

#include <libhostlink/types.hxx>

#include <libhostlink/export.hxx>

namespace hostlink
{
  // String-keyed side channel passed with every entry point invocation (the
  // host's journal data).
  //
  using journal_data = map<string, string>;

  struct command_data
  {
    journal_data journal;
  };

  LIBHOSTLINK_SYMEXPORT optional<string>
  journal_value (const journal_data&, const string& key);

  // Parse a boolean-like value: true/false, yes/no, on/off, 1/0, ignoring
  // case and surrounding whitespace. Return nullopt if unrecognized.
  //
  LIBHOSTLINK_SYMEXPORT optional<bool>
  parse_flag (const string&);

  // Tracer process id from a /proc/<pid>/status listing, 0 if untraced.
  // Return nullopt if the field is missing or malformed.
  //
  LIBHOSTLINK_SYMEXPORT optional<long>
  tracer_pid (std::istream& status);

  // Block until a debugger attaches to this process or the timeout expires.
  // Return true if a debugger is attached.
  //
  LIBHOSTLINK_SYMEXPORT bool
  wait_for_debugger (std::chrono::milliseconds timeout);
}
