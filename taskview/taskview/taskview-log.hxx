#pragma once

#include <string>
#include <ostream>
#include <utility>

namespace taskview
{
  // Diagnostics logger.
  //
  // A cheap value type carried by every task handle. It writes prefixed
  // lines ("trace: fetch|download: ...") to a diagnostics stream, normally
  // std::cerr, if the message level is within the configured verbosity.
  // Writes from concurrent threads are serialized so that lines do not
  // interleave.
  //
  // A default-constructed logger is disabled.
  //
  class logger
  {
  public:
    logger () = default;

    logger (std::ostream& os, int verbosity, std::string name = std::string ())
      : os_ (&os), verbosity_ (verbosity), name_ (std::move (name))
    {
    }

    // Return a logger for a nested context, with the segment appended to
    // the name.
    //
    logger
    named (const std::string& segment) const;

    bool
    enabled (int level) const noexcept
    {
      return os_ != nullptr && level <= verbosity_;
    }

    int
    verbosity () const noexcept
    {
      return verbosity_;
    }

    const std::string&
    name () const noexcept
    {
      return name_;
    }

    // Write a trace line if level is enabled.
    //
    void
    trace (int level, const std::string& message) const;

    // Write a warning line unless the logger is disabled.
    //
    void
    warn (const std::string& message) const;

  private:
    void
    write (const char* prefix, const std::string& message) const;

    std::ostream* os_ {nullptr};
    int verbosity_ {0};
    std::string name_;
  };
}
