#pragma once

#include <memory>
#include <string>
#include <iosfwd>
#include <iostream>
#include <optional>
#include <functional>
#include <filesystem>

#include <boost/asio.hpp>

#include <taskview/taskview-log.hxx>

#include <taskview/ui/ui.hxx>
#include <taskview/ui/ui-task.hxx>

namespace taskview
{
  namespace asio = boost::asio;

  // Presentation settings, normally filled from the command line.
  //
  struct ui_options
  {
    bool quiet {false};    // No output at all.
    bool no_term {false};  // Never use the terminal UI.

    // Record everything into this directory instead of rendering it.
    //
    std::optional<std::filesystem::path> debug_path;
  };

  enum class ui_kind
  {
    silent,
    simple,
    complex,
    debug
  };

  std::string
  to_string (ui_kind);

  std::ostream&
  operator<< (std::ostream&, ui_kind);

  // Decide which backend to use: silent if quiet, debug if a debug path is
  // set, complex if the output is a terminal, and simple otherwise.
  //
  ui_kind
  select_ui (const ui_options&, bool terminal);

  // Create the backend selected by the options for output written to out,
  // with fd being the file descriptor behind it (used to detect and query
  // the terminal).
  //
  std::unique_ptr<ui>
  make_ui (asio::io_context&,
           const ui_options&,
           std::ostream& out = std::cout,
           int fd = 1,
           logger = logger ());

  // Run the backend and the work concurrently.
  //
  // The work receives the root task. Once it returns, the root is completed
  // and the backend shut down. If it throws, the backend is canceled and the
  // work's exception is rethrown. If the backend fails while the work is
  // still running, the work is canceled and the backend failure is rethrown.
  // Otherwise any backend failure is rethrown.
  //
  asio::awaitable<void>
  run_ui (ui&, std::function<asio::awaitable<void> (task)> work);
}
