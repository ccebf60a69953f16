#include <taskview/ui/ui-registry.hxx>

#include <variant>
#include <algorithm>

#include <taskview/tracker/tracker-format.hxx>

using namespace std;

namespace taskview
{
  // Quoted name for diagnostics.
  //
  static string
  quote (const task_name& n)
  {
    return n.empty () ? string ("<root>") : '\'' + display_name (n) + '\'';
  }

  // task_tracker
  //

  string task_tracker::
  format_progress (bool sc, bool sb)
  {
    string r (counter.format (sc));

    if (bytes)
    {
      if (!r.empty ())
        r += ' ';

      r += bytes->format (sb);
    }

    return r;
  }

  string task_tracker::
  format_completed (duration_type d) const
  {
    string r;

    if (counter.total () != 0)
      r += '[' + to_string (counter.total ()) + ']';

    if (!r.empty ())
      r += ' ';

    // If progress was tracked but no bytes were ever reported, the work was
    // most likely satisfied from a cache.
    //
    if (bytes)
      r += bytes->completed () == 0
        ? string ("(cached)")
        : bytes->format_completed (d);
    else
      r += "in " + format_elapsed (d);

    return r;
  }

  // task_registry
  //

  task_tracker* task_registry::
  find (const task_name& n)
  {
    auto i (trackers_.find (name_key (n)));
    return i != trackers_.end () ? &i->second : nullptr;
  }

  const task_tracker* task_registry::
  find (const task_name& n) const
  {
    auto i (trackers_.find (name_key (n)));
    return i != trackers_.end () ? &i->second : nullptr;
  }

  task_tracker* task_registry::
  parent (const task_name& n)
  {
    if (n.empty ())
      return nullptr;

    return find (task_name (n.begin (), n.end () - 1));
  }

  task_tracker& task_registry::
  open (const task_name& n, const char* op, const string& d)
  {
    if (task_tracker* t = find (n))
      return *t;

    throw protocol_error (op,
                          n,
                          string (op) + "() called on non-existent task " +
                          quote (n) + d);
  }

  task_tracker& task_registry::
  on_create (const task_name& n, time_point t)
  {
    auto r (trackers_.try_emplace (name_key (n), n, t));

    if (!r.second)
      throw protocol_error ("create",
                            n,
                            "non-unique task name " + quote (n));

    if (task_tracker* p = parent (n))
      p->counter.add_total ();

    return r.first->second;
  }

  task_tracker task_registry::
  on_complete (const task_name& n, time_point)
  {
    auto i (trackers_.find (name_key (n)));

    if (i == trackers_.end ())
      throw protocol_error ("complete",
                            n,
                            "complete() called on non-existent task " +
                            quote (n));

    const task_counter& c (i->second.counter);

    if (!c.done ())
      throw protocol_error ("complete",
                            n,
                            "complete() called on task " + quote (n) +
                            " with " + to_string (c.total () - c.completed ()) +
                            " open sub-task(s)");

    task_tracker r (move (i->second));
    trackers_.erase (i);

    if (task_tracker* p = parent (n))
      p->counter.add_completed ();

    return r;
  }

  task_tracker& task_registry::
  on_info (const task_name& n, const string& m)
  {
    return open (n, "info", " with message: " + m);
  }

  task_tracker& task_registry::
  on_progress (const task_name& n, int64_t c, int64_t t, time_point tm)
  {
    task_tracker& r (open (n, "update", string ()));

    if (!r.bytes)
      r.bytes.emplace (tm);

    r.bytes->add (tm, c, t);
    return r;
  }

  vector<task_tracker*> task_registry::
  ordered ()
  {
    vector<task_tracker*> r;
    r.reserve (trackers_.size ());

    for (auto& p: trackers_)
    {
      if (!p.second.name.empty ())
        r.push_back (&p.second);
    }

    sort (r.begin (), r.end (),
          [] (const task_tracker* a, const task_tracker* b)
    {
      if (a->name.size () != b->name.size ())
        return a->name.size () < b->name.size ();

      // Same depth. Tie on the last segment falls back to the full key so
      // that the order is stable between redraws.
      //
      const string& x (a->name.back ());
      const string& y (b->name.back ());

      if (x != y)
        return x < y;

      return a->name < b->name;
    });

    return r;
  }

  // process_event()
  //

  namespace
  {
    struct dispatcher
    {
      task_registry& r;
      const event& e;

      string
      operator() (const info_event& i) const
      {
        r.on_info (e.name, i.message);
        return display_name (e.name) + " ↦ " + i.message + '\n';
      }

      string
      operator() (const task_event& t) const
      {
        if (!t.done)
        {
          r.on_create (e.name, e.time);
          return string ();
        }

        task_tracker k (r.on_complete (e.name, e.time));

        // The root's completion marks the end of the session; there is
        // nothing interesting to say about it.
        //
        if (e.name.empty ())
          return string ();

        return display_name (e.name) + " ↦ Completed " +
               k.format_completed (e.time - k.created) + '\n';
      }

      string
      operator() (const progress_event& p) const
      {
        r.on_progress (e.name, p.complete, p.total, e.time);
        return string ();
      }
    };
  }

  string
  process_event (task_registry& r, const event& e)
  {
    return visit (dispatcher {r, e}, e.payload);
  }
}
