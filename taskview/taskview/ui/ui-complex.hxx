#pragma once

#include <string>
#include <cstddef>
#include <ostream>

#include <taskview/ui/ui-loop.hxx>

namespace taskview
{
  // Return true if the file descriptor refers to a terminal.
  //
  bool
  is_terminal (int fd) noexcept;

  // Return the width of the terminal in columns. Throw system_error if the
  // file descriptor does not refer to a terminal.
  //
  std::size_t
  terminal_width (int fd);

  // Interactive terminal UI.
  //
  // Redraws a single colored status line in place five times a second.
  // Informational and completion lines scroll above it. The width is
  // re-read when the terminal is resized.
  //
  class complex_ui: public event_loop_ui
  {
  public:
    static constexpr duration_type tick_interval =
      std::chrono::milliseconds (200);

    // The stream must write to the terminal referred to by fd.
    //
    complex_ui (asio::io_context&,
                std::ostream&,
                int fd,
                logger = logger ());

    std::size_t
    width () const noexcept
    {
      return width_;
    }

  protected:
    virtual void
    on_start () override;

    virtual void
    on_event (const event&) override;

    virtual void
    on_tick (time_point) override;

    virtual void
    on_stop () override;

    virtual asio::awaitable<void>
    background () override;

    virtual void
    interrupt () override;

  private:
    void
    write (const std::string&);

    std::ostream& out_;
    int fd_;
    std::size_t width_ {0};
    bool started_ {false};

    // Last rendered status line, redrawn after every message.
    //
    std::string status_;

    asio::signal_set signals_;
  };
}
