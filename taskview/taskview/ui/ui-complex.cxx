#include <taskview/ui/ui-complex.hxx>

#include <ios>
#include <cerrno>
#include <system_error>

#include <signal.h>    // SIGWINCH
#include <unistd.h>    // isatty()
#include <sys/ioctl.h> // ioctl(), TIOCGWINSZ

#include <taskview/ui/ui-render.hxx>

using namespace std;

namespace taskview
{
  bool
  is_terminal (int fd) noexcept
  {
    return isatty (fd) == 1;
  }

  size_t
  terminal_width (int fd)
  {
    winsize ws {};

    if (ioctl (fd, TIOCGWINSZ, &ws) == -1)
      throw system_error (errno,
                          generic_category (),
                          "unable to get terminal size");

    // Some pseudo-terminals report a zero size until the first resize.
    //
    return ws.ws_col != 0 ? ws.ws_col : 80;
  }

  complex_ui::
  complex_ui (asio::io_context& ioc, ostream& o, int fd, logger l)
      : event_loop_ui (ioc, tick_interval, move (l)),
        out_ (o),
        fd_ (fd),
        signals_ (strand_)
  {
  }

  void complex_ui::
  on_start ()
  {
    width_ = terminal_width (fd_);

    // Watch for terminal resizes.
    //
    signals_.add (SIGWINCH);

    started_ = true;
    log_.trace (1, "terminal width " + to_string (width_));
  }

  void complex_ui::
  on_event (const event& e)
  {
    string s (process_event (registry_, e));

    // Nothing left to show.
    //
    if (registry_.empty ())
      status_.clear ();

    // Clear the status line, output the message (which stays in the
    // terminal), and redraw the status below it.
    //
    if (!s.empty ())
      write (clear_line + s + status_);
  }

  void complex_ui::
  on_tick (time_point)
  {
    status_ = render_status_line (status_fragments (registry_, width_));

    if (!status_.empty ())
      write (clear_line + status_);
  }

  void complex_ui::
  on_stop ()
  {
    // Leave the cursor below the last status line.
    //
    if (started_)
      write ("\n");
  }

  asio::awaitable<void> complex_ui::
  background ()
  {
    while (!finished ())
    {
      boost::system::error_code ec;
      co_await signals_.async_wait (asio::redirect_error (asio::use_awaitable,
                                                          ec));

      if (ec == asio::error::operation_aborted || finished ())
        break;

      if (ec)
        throw boost::system::system_error (ec, "unable to watch terminal size");

      width_ = terminal_width (fd_);
      log_.trace (1, "terminal resized to " + to_string (width_));
    }
  }

  void complex_ui::
  interrupt ()
  {
    signals_.cancel ();
  }

  void complex_ui::
  write (const string& s)
  {
    out_ << s;
    out_.flush ();

    if (!out_)
      throw ios_base::failure ("unable to write to terminal");
  }
}
