#include <taskview/ui/ui-render.hxx>

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/color.hpp>
#include <ftxui/screen/screen.hpp>
#include <ftxui/screen/string.hpp>

using namespace std;

namespace taskview
{
  string
  render_status_block (task_registry& r)
  {
    vector<task_tracker*> ts (r.ordered ());

    if (ts.empty ())
      return string ();

    string s ("[---------- status -------\n");

    for (task_tracker* t: ts)
    {
      string p (t->format_progress (false /* short */, false /* short */));

      if (!p.empty ())
        s += display_name (t->name) + " ↦ " + p + '\n';
    }

    s += "-------------------------]\n";
    return s;
  }

  vector<status_fragment>
  status_fragments (task_registry& r, size_t width)
  {
    const size_t sw (ftxui::string_width (status_separator));

    vector<status_fragment> fs;
    size_t n (0);

    vector<task_tracker*> ts (r.ordered ());
    for (size_t i (0); i != ts.size (); ++i)
    {
      task_tracker& t (*ts[i]);

      // Past the fourth task switch to the short progress form to fit more.
      //
      string p (t.format_progress (true, i > 3));

      if (p.empty ())
        continue;

      string s (display_name (t.name) + " ↦ " + p);
      size_t w (ftxui::string_width (s));

      if (n + sw + w >= width)
        break;

      n += sw + w;
      fs.push_back (status_fragment {move (s), i, w});
    }

    return fs;
  }

  string
  render_status_line (const vector<status_fragment>& fs)
  {
    using namespace ftxui;

    static const Color palette[] = {
      Color::Red,
      Color::Green,
      Color::Yellow,
      Color::Blue,
      Color::Magenta,
      Color::Cyan,
      Color::White};

    if (fs.empty ())
      return string ();

    const int sw (string_width (status_separator));

    Elements es;
    int w (0);

    for (const status_fragment& f: fs)
    {
      if (!es.empty ())
      {
        es.push_back (text (status_separator));
        w += sw;
      }

      es.push_back (text (f.text) |
                    color (palette[f.index % (sizeof (palette) /
                                              sizeof (palette[0]))]));
      w += static_cast<int> (f.width);
    }

    // Size the screen to the content so that no padding is emitted.
    //
    Element doc (hbox (move (es)));
    Screen screen (Screen::Create (Dimension::Fixed (w), Dimension::Fixed (1)));
    Render (screen, doc);

    return screen.ToString ();
  }
}
