#pragma once

#include <taskview/taskview-log.hxx>

#include <taskview/ui/ui.hxx>

namespace taskview
{
  // UI that outputs nothing (quiet mode).
  //
  // The tasks it hands out have no sink so producer calls cost nothing.
  //
  class silent_ui: public basic_ui
  {
  public:
    explicit
    silent_ui (asio::io_context&, logger = logger ());

    virtual task
    root () override;

    virtual asio::awaitable<void>
    run () override;

  private:
    asio::awaitable<void>
    loop ();

    logger log_;
  };
}
