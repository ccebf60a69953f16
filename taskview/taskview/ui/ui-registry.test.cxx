#include <taskview/ui/ui-registry.hxx>

#include <chrono>
#include <string>
#include <vector>
#include <cassert>

using namespace std;
using namespace taskview;

using chrono::seconds;
using chrono::milliseconds;

static const task_name root;
static const task_name fetch {"fetch"};
static const task_name download {"fetch", "download"};

static event
created (time_point t, const task_name& n)
{
  return event (t, n, task_event {false});
}

static event
completed (time_point t, const task_name& n)
{
  return event (t, n, task_event {true});
}

static event
updated (time_point t, const task_name& n, int64_t c, int64_t tl)
{
  return event (t, n, progress_event {c, tl});
}

// Process an event that must be rejected and return the error.
//
static protocol_error
rejected (task_registry& r, const event& e)
{
  try
  {
    process_event (r, e);
  }
  catch (const protocol_error& x)
  {
    return x;
  }

  assert (false);
  return protocol_error ("", task_name (), "");
}

static void
test_lifecycle ()
{
  time_point t (clock_type::now ());
  task_registry r;

  assert (process_event (r, created (t, root)).empty ());
  assert (process_event (r, created (t, fetch)).empty ());

  assert (r.size () == 2);
  assert (r.parent (fetch) == r.find (root));
  assert (r.parent (root) == nullptr);
  assert (r.find (root)->counter.total () == 1);

  assert (process_event (r, event (t, fetch, info_event {"hello"})) ==
          "fetch ↦ hello\n");

  string s (process_event (r, completed (t + milliseconds (1500), fetch)));
  assert (s == "fetch ↦ Completed in 1.500s\n");

  assert (r.find (fetch) == nullptr);
  assert (r.find (root)->counter.completed () == 1);
  assert (r.find (root)->counter.done ());

  // The root completes silently.
  //
  assert (process_event (r, completed (t, root)).empty ());
  assert (r.empty ());
}

static void
test_duplicate ()
{
  time_point t (clock_type::now ());
  task_registry r;

  process_event (r, created (t, root));
  process_event (r, created (t, fetch));

  protocol_error e (rejected (r, created (t, fetch)));
  assert (e.operation () == "create");
  assert (e.name () == fetch);

  // The parent was not counted twice.
  //
  assert (r.find (root)->counter.total () == 1);

  // Once closed the name may be reused.
  //
  process_event (r, completed (t, fetch));
  process_event (r, created (t, fetch));
  assert (r.find (root)->counter.total () == 2);
}

static void
test_unknown ()
{
  time_point t (clock_type::now ());
  task_registry r;

  process_event (r, created (t, root));

  assert (rejected (r, event (t, fetch, info_event {"x"})).operation () ==
          "info");
  assert (rejected (r, updated (t, fetch, 1, 1)).operation () == "update");
  assert (rejected (r, completed (t, fetch)).operation () == "complete");

  // Completing twice.
  //
  process_event (r, created (t, fetch));
  process_event (r, completed (t, fetch));
  assert (rejected (r, completed (t, fetch)).name () == fetch);
}

// Completing a task with an open child is rejected and leaves the state as
// it was.
//
static void
test_open_child ()
{
  time_point t (clock_type::now ());
  task_registry r;

  process_event (r, created (t, root));
  process_event (r, created (t, fetch));
  process_event (r, created (t, download));

  protocol_error e (rejected (r, completed (t, fetch)));
  assert (e.operation () == "complete");
  assert (e.name () == fetch);
  assert (string (e.what ()).find ("1 open sub-task") != string::npos);

  assert (r.find (fetch) != nullptr);
  assert (r.find (root)->counter.completed () == 0);

  process_event (r, completed (t, download));
  process_event (r, completed (t, fetch));
  assert (r.find (fetch) == nullptr);
}

static void
test_ordered ()
{
  time_point t (clock_type::now ());
  task_registry r;

  process_event (r, created (t, root));
  process_event (r, created (t, task_name {"b"}));
  process_event (r, created (t, task_name {"a"}));
  process_event (r, created (t, task_name {"b", "a"}));
  process_event (r, created (t, task_name {"a", "z"}));
  process_event (r, created (t, task_name {"a", "c"}));

  vector<string> ns;
  for (task_tracker* k: r.ordered ())
    ns.push_back (display_name (k->name));

  assert ((ns == vector<string> {"a", "b", "b|a", "a|c", "a|z"}));
}

// Create fetch, then download under it with three updates, then complete
// both.
//
static void
test_scenario ()
{
  time_point t (clock_type::now ());
  task_registry r;

  process_event (r, created (t, root));
  process_event (r, created (t, fetch));
  process_event (r, created (t, download));
  process_event (r, updated (t, download, 0, 0));
  process_event (r, updated (t + seconds (1), download, 4, 100));
  process_event (r, updated (t + seconds (2), download, 50, 0));
  process_event (r, updated (t + seconds (3), download, 46, 0));

  task_tracker& d (*r.find (download));
  assert (d.bytes);
  assert (d.bytes->completed () == 100);
  assert (d.bytes->total () == 100);
  assert (d.format_progress (true, true) == "(100.0%)");

  // Completing fetch first is fatal.
  //
  rejected (r, completed (t + seconds (4), fetch));

  string s (process_event (r, completed (t + seconds (4), download)));
  assert (s == "fetch|download ↦ Completed 100 B in 4s (25 B/s)\n");

  task_tracker& f (*r.find (fetch));
  assert (f.counter.completed () == 1 && f.counter.total () == 1);
  assert (f.format_progress (true, false) == "[1/1]");

  s = process_event (r, completed (t + seconds (5), fetch));
  assert (s == "fetch ↦ Completed [1] in 5s\n");
}

// Progress tracked but no bytes ever reported.
//
static void
test_cached ()
{
  time_point t (clock_type::now ());
  task_registry r;

  process_event (r, created (t, root));
  process_event (r, created (t, fetch));
  process_event (r, updated (t, fetch, 0, 0));

  assert (process_event (r, completed (t + seconds (1), fetch)) ==
          "fetch ↦ Completed (cached)\n");
}

int
main ()
{
  test_lifecycle ();
  test_duplicate ();
  test_unknown ();
  test_open_child ();
  test_ordered ();
  test_scenario ();
  test_cached ();
}
