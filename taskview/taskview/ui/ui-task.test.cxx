#include <taskview/ui/ui-task.hxx>

#include <mutex>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <cassert>
#include <ostream>
#include <sstream>
#include <variant>
#include <stdexcept>

using namespace std;
using namespace taskview;

// Sink that records everything it receives.
//
class capture: public event_sink
{
public:
  virtual void
  send (event e) override
  {
    lock_guard<mutex> l (m_);
    events_.push_back (move (e));
  }

  vector<event>
  events () const
  {
    lock_guard<mutex> l (m_);
    return events_;
  }

private:
  mutable mutex m_;
  vector<event> events_;
};

static bool
created (const event& e, const task_name& n)
{
  const task_event* t (get_if<task_event> (&e.payload));
  return t != nullptr && !t->done && e.name == n;
}

static bool
completed (const event& e, const task_name& n)
{
  const task_event* t (get_if<task_event> (&e.payload));
  return t != nullptr && t->done && e.name == n;
}

static bool
updated (const event& e, const task_name& n, int64_t c, int64_t t)
{
  const progress_event* p (get_if<progress_event> (&e.payload));
  return p != nullptr && p->complete == c && p->total == t && e.name == n;
}

static void
test_lifecycle ()
{
  auto s (make_shared<capture> ());

  task r (make_root_task (s, logger ()));
  task a (r.subtask ("fetch"));
  a.info ("hello");
  a.infof ("%d files", 3);
  a.complete ();

  vector<event> es (s->events ());

  assert (es.size () == 5);
  assert (created (es[0], task_name ()));
  assert (created (es[1], task_name {"fetch"}));

  assert (get<info_event> (es[2].payload).message == "hello");
  assert (get<info_event> (es[3].payload).message == "3 files");
  assert (es[3].name == task_name {"fetch"});

  assert (completed (es[4], task_name {"fetch"}));

  assert (display_name (a.name ()) == "fetch");
  assert (event_kind (es[2]) == string ("info"));
}

// Formatted messages with mixed arguments, including one longer than any
// small fixed buffer.
//
static void
test_infof ()
{
  auto s (make_shared<capture> ());

  task r (make_root_task (s, logger ()));
  r.infof ("%s: %zu of %d", "fetch", static_cast<size_t> (2), 5);
  r.infof ("%s", string (1000, 'x').c_str ());
  r.infof ("%s", "");

  vector<event> es (s->events ());

  assert (es.size () == 4);
  assert (get<info_event> (es[1].payload).message == "fetch: 2 of 5");
  assert (get<info_event> (es[2].payload).message == string (1000, 'x'));
  assert (get<info_event> (es[3].payload).message.empty ());
}

// A progress subtask announces itself and starts byte tracking right away.
//
static void
test_progress_subtask ()
{
  auto s (make_shared<capture> ());

  task r (make_root_task (s, logger ()));
  progress p (r.subtask_with_progress ("download"));

  vector<event> es (s->events ());

  assert (es.size () == 3);
  assert (created (es[1], task_name {"download"}));
  assert (updated (es[2], task_name {"download"}, 0, 0));

  // Derived from a plain task there is nothing to aggregate into.
  //
  assert (p.aggregate_to ().empty ());
}

// Updates on a nested progress also apply to every progress ancestor,
// nearest first.
//
static void
test_fan_out ()
{
  auto s (make_shared<capture> ());

  task r (make_root_task (s, logger ()));
  progress p (r.subtask_with_progress ("fetch"));
  progress q (p.subtask_with_progress ("file"));
  progress x (q.subtask_with_progress ("part"));

  const task_name pn {"fetch"};
  const task_name qn {"fetch", "file"};
  const task_name xn {"fetch", "file", "part"};

  assert (q.aggregate_to () == vector<task_name> {pn});
  assert ((x.aggregate_to () == vector<task_name> {qn, pn}));

  size_t b (s->events ().size ());

  x.update (10, 100);

  vector<event> es (s->events ());

  assert (es.size () == b + 3);
  assert (updated (es[b + 0], xn, 10, 100));
  assert (updated (es[b + 1], qn, 10, 100));
  assert (updated (es[b + 2], pn, 10, 100));

  // Fan-out is not part of the name: each level is still completed
  // separately.
  //
  x.complete ();
  assert (completed (s->events ().back (), xn));
}

static void
test_write ()
{
  auto s (make_shared<capture> ());

  task r (make_root_task (s, logger ()));
  progress p (r.subtask_with_progress ("fetch"));
  progress q (p.subtask_with_progress ("file"));

  size_t b (s->events ().size ());

  const char d[] = "hello";
  assert (q.write (d, 5) == 5);

  vector<event> es (s->events ());

  assert (es.size () == b + 2);
  assert (updated (es[b + 0], task_name {"fetch", "file"}, 5, 0));
  assert (updated (es[b + 1], task_name {"fetch"}, 5, 0));
}

// Sum the completed bytes reported for a task.
//
static int64_t
reported (const capture& s, const task_name& n)
{
  int64_t r (0);

  for (const event& e: s.events ())
  {
    if (e.name == n)
      if (const progress_event* p = get_if<progress_event> (&e.payload))
        r += p->complete;
  }

  return r;
}

static void
test_streambuf ()
{
  auto s (make_shared<capture> ());

  task r (make_root_task (s, logger ()));
  progress p (r.subtask_with_progress ("upload"));

  // Counting only.
  //
  {
    progress_streambuf sb (p);
    ostream os (&sb);

    os << "hello, " << 'w' << "orld";
    os.flush ();

    assert (os);
  }

  assert (reported (*s, task_name {"upload"}) == 12);

  // Tee into another stream.
  //
  {
    ostringstream t;
    progress_streambuf sb (p, t.rdbuf ());
    ostream os (&sb);

    os << "0123456789";
    os.flush ();

    assert (os);
    assert (t.str () == "0123456789");
  }

  assert (reported (*s, task_name {"upload"}) == 22);
}

static void
test_invalid_segment ()
{
  auto s (make_shared<capture> ());
  task r (make_root_task (s, logger ()));

  size_t b (s->events ().size ());

  try
  {
    r.subtask ("");
    assert (false);
  }
  catch (const invalid_argument&) {}

  try
  {
    r.subtask_with_progress (string ("a\0b", 3));
    assert (false);
  }
  catch (const invalid_argument&) {}

  // Nothing is sent for a rejected segment.
  //
  assert (s->events ().size () == b);
}

// Without a sink every call is a no-op.
//
static void
test_detached ()
{
  task r (make_root_task (nullptr, logger ()));
  assert (!r.attached ());

  progress p (r.subtask_with_progress ("x"));
  p.update (1, 2);
  p.info ("ignored");
  assert (p.write ("abc", 3) == 3);
  p.complete ();

  task d;
  assert (!d.attached ());
  d.info ("ignored");
}

// Events from concurrent producers all arrive and each producer's events
// stay in order.
//
static void
test_concurrent ()
{
  auto s (make_shared<capture> ());
  task r (make_root_task (s, logger ()));

  const size_t n (8);
  const int64_t m (100);

  vector<thread> ts;
  for (size_t i (0); i != n; ++i)
  {
    ts.emplace_back ([&r, i, m]
    {
      progress p (r.subtask_with_progress ("t" + to_string (i)));

      for (int64_t j (1); j <= m; ++j)
        p.update (j, 0);

      p.complete ();
    });
  }

  for (thread& t: ts)
    t.join ();

  vector<event> es (s->events ());
  assert (es.size () == 1 + n * (1 + 1 + m + 1));

  for (size_t i (0); i != n; ++i)
  {
    task_name tn {"t" + to_string (i)};
    int64_t last (-1);

    for (const event& e: es)
    {
      if (e.name != tn)
        continue;

      if (const progress_event* p = get_if<progress_event> (&e.payload))
      {
        assert (p->complete > last);
        last = p->complete;
      }
    }

    assert (last == m);
  }
}

// Trace output goes to the configured stream with the task context.
//
static void
test_trace ()
{
  ostringstream o;
  task r (make_root_task (nullptr, logger (o, 2, "test")));

  task a (r.subtask ("a"));
  a.info ("hi");

  const string s (o.str ());
  assert (s.find ("trace: test: creating child task a\n") != string::npos);
  assert (s.find ("trace: test|a: info: hi\n") != string::npos);
}

int
main ()
{
  test_lifecycle ();
  test_infof ();
  test_progress_subtask ();
  test_fan_out ();
  test_write ();
  test_streambuf ();
  test_invalid_segment ();
  test_detached ();
  test_concurrent ();
  test_trace ();
}
