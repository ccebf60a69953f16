#pragma once

#include <string>
#include <ostream>

#include <taskview/ui/ui-loop.hxx>

namespace taskview
{
  // Line-oriented UI for non-terminal output (pipes, CI logs).
  //
  // Writes informational and completion lines as they arrive and, every
  // second, a block with the progress of the open tasks.
  //
  class simple_ui: public event_loop_ui
  {
  public:
    static constexpr duration_type tick_interval = std::chrono::seconds (1);

    simple_ui (asio::io_context&, std::ostream&, logger = logger ());

  protected:
    virtual void
    on_event (const event&) override;

    virtual void
    on_tick (time_point) override;

    virtual void
    on_stop () override;

  private:
    // Throw ios_base::failure if the stream goes bad.
    //
    void
    write (const std::string&);

    std::ostream& out_;
  };
}
