#include <taskview/ui/ui-simple.hxx>

#include <ios>

#include <taskview/ui/ui-render.hxx>

using namespace std;

namespace taskview
{
  simple_ui::
  simple_ui (asio::io_context& ioc, ostream& o, logger l)
      : event_loop_ui (ioc, tick_interval, move (l)), out_ (o)
  {
  }

  void simple_ui::
  on_event (const event& e)
  {
    string s (process_event (registry_, e));

    if (!s.empty ())
      write (s);
  }

  void simple_ui::
  on_tick (time_point)
  {
    string s (render_status_block (registry_));

    if (!s.empty ())
      write (s);
  }

  void simple_ui::
  on_stop ()
  {
    out_.flush ();

    if (!out_)
      throw ios_base::failure ("unable to flush output");
  }

  void simple_ui::
  write (const string& s)
  {
    out_ << s;
    out_.flush ();

    if (!out_)
      throw ios_base::failure ("unable to write message to output");
  }
}
