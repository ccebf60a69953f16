#include <taskview/ui/ui-render.hxx>

#include <chrono>
#include <string>
#include <vector>
#include <cassert>

#include <ftxui/screen/string.hpp>

using namespace std;
using namespace taskview;

using chrono::seconds;

static bool
starts_with (const string& s, const string& p)
{
  return s.compare (0, p.size (), p) == 0;
}

// Open a task with 50 of 100 bytes done.
//
static void
half_done (task_registry& r, const task_name& n, time_point t)
{
  r.on_create (n, t);
  r.on_progress (n, 0, 0, t);
  r.on_progress (n, 50, 100, t + seconds (1));
}

static void
test_status_block ()
{
  time_point t (clock_type::now ());
  task_registry r;

  r.on_create (task_name (), t);
  assert (render_status_block (r).empty ());

  r.on_create (task_name {"fetch"}, t);
  half_done (r, task_name {"fetch", "download"}, t);

  string s (render_status_block (r));

  assert (starts_with (s, "[---------- status -------\nfetch ↦ [0/1 (0.00%)]\n"
                          "fetch|download ↦ 50 B/100 B (50.00%) "));

  const string f ("-------------------------]\n");
  assert (s.size () > f.size () && s.substr (s.size () - f.size ()) == f);
}

static void
test_fragments ()
{
  time_point t (clock_type::now ());
  task_registry r;

  r.on_create (task_name (), t);

  for (const char* n: {"a", "b", "c", "d", "e", "f"})
    half_done (r, task_name {n}, t);

  vector<status_fragment> fs (status_fragments (r, 10000));
  assert (fs.size () == 6);

  // The first four get the long form, the rest the short one.
  //
  assert (starts_with (fs[0].text, "a ↦ 50 B/100 B (50.00%) "));
  assert (starts_with (fs[3].text, "d ↦ 50 B/100 B (50.00%) "));
  assert (starts_with (fs[4].text, "e ↦ (50.0%)"));
  assert (starts_with (fs[5].text, "f ↦ (50.0%)"));

  for (size_t i (0); i != fs.size (); ++i)
  {
    assert (fs[i].index == i);
    assert (fs[i].width == static_cast<size_t> (
              ftxui::string_width (fs[i].text)));
  }

  // The separator counts towards the width and the total must stay below
  // the terminal width.
  //
  size_t sw (ftxui::string_width (status_separator));

  assert (status_fragments (r, sw + fs[0].width + 1).size () == 1);
  assert (status_fragments (r, sw + fs[0].width).empty ());
}

// Tasks with nothing to report are skipped but keep their position (and
// therefore color).
//
static void
test_fragments_skip ()
{
  time_point t (clock_type::now ());
  task_registry r;

  r.on_create (task_name (), t);
  r.on_create (task_name {"a"}, t);
  half_done (r, task_name {"b"}, t);

  vector<status_fragment> fs (status_fragments (r, 10000));
  assert (fs.size () == 1);
  assert (fs[0].index == 1);
  assert (starts_with (fs[0].text, "b ↦ "));
}

static void
test_status_line ()
{
  time_point t (clock_type::now ());
  task_registry r;

  assert (render_status_line (vector<status_fragment> ()).empty ());

  r.on_create (task_name (), t);
  half_done (r, task_name {"fetch"}, t);
  half_done (r, task_name {"push"}, t);

  string s (render_status_line (status_fragments (r, 10000)));

  assert (s.find ("fetch") != string::npos);
  assert (s.find ("push") != string::npos);
  assert (s.find ("\033[") != string::npos); // Colored.
  assert (s.find ('\n') == string::npos);
}

int
main ()
{
  test_status_block ();
  test_fragments ();
  test_fragments_skip ();
  test_status_line ();
}
