#include <taskview/ui/ui-task.hxx>

#include <cstdio>
#include <cstdarg>
#include <sstream>
#include <stdexcept>

using namespace std;

namespace taskview
{
  void task::
  send (event_payload p) const
  {
    send (name_, move (p));
  }

  void task::
  send (const task_name& n, event_payload p) const
  {
    if (sink_ != nullptr)
      sink_->send (event (clock_type::now (), n, move (p)));
  }

  void task::
  info (const string& m) const
  {
    log_.trace (2, "info: " + m);
    send (info_event {m});
  }

  void task::
  infof (const char* f, ...) const
  {
    // Measure first, then format into a buffer of the right size. Note that
    // a va_list can only be traversed once so we need a copy for the first
    // pass.
    //
    va_list a;
    va_start (a, f);

    va_list c;
    va_copy (c, a);
    int n (vsnprintf (nullptr, 0, f, c));
    va_end (c);

    string m;

    if (n > 0)
    {
      m.resize (static_cast<size_t> (n) + 1);
      vsnprintf (&m[0], m.size (), f, a);
      m.resize (static_cast<size_t> (n));
    }

    va_end (a);

    info (m);
  }

  task task::
  derive (const string& s) const
  {
    if (s.empty ())
      throw invalid_argument ("empty task name segment");

    if (s.find (key_separator) != string::npos)
      throw invalid_argument ("task name segment '" + s + "' contains "
                              "a null character");

    task_name n (name_);
    n.push_back (s);

    return task (move (n), sink_, log_.named (s));
  }

  task task::
  subtask (const string& s) const
  {
    log_.trace (1, "creating child task " + s);

    task r (derive (s));
    r.send (task_event {false});
    return r;
  }

  progress task::
  subtask_with_progress (const string& s) const
  {
    log_.trace (1, "creating child task with progress " + s);

    // The initial empty update lets the backend set up byte tracking right
    // away rather than on the first real update.
    //
    task r (subtask (s));
    r.send (progress_event {0, 0});

    return progress (move (r), vector<task_name> ());
  }

  void task::
  complete () const
  {
    log_.trace (1, "completed");
    send (task_event {true});
  }

  progress progress::
  subtask_with_progress (const string& s) const
  {
    progress r (task::subtask_with_progress (s));

    // Nearest ancestor first, then whatever we aggregate into ourselves.
    //
    r.aggregate_.reserve (aggregate_.size () + 1);
    r.aggregate_.push_back (name_);
    r.aggregate_.insert (r.aggregate_.end (),
                         aggregate_.begin (), aggregate_.end ());
    return r;
  }

  void progress::
  update (int64_t c, int64_t t) const
  {
    if (log_.enabled (4))
    {
      ostringstream o;
      o << "updating (" << c << ", " << t << ")";
      log_.trace (4, o.str ());
    }

    if (sink_ == nullptr)
      return;

    send (progress_event {c, t});

    for (const task_name& n: aggregate_)
      send (n, progress_event {c, t});
  }

  size_t progress::
  write (const void*, size_t n) const
  {
    update (static_cast<int64_t> (n), 0);
    return n;
  }

  task
  make_root_task (shared_ptr<event_sink> s, logger l)
  {
    task r (task_name (), move (s), move (l));

    r.log ().trace (1, "creating root task");
    r.send (task_event {false});

    return r;
  }

  // progress_streambuf
  //

  progress_streambuf::int_type progress_streambuf::
  overflow (int_type c)
  {
    if (traits_type::eq_int_type (c, traits_type::eof ()))
      return traits_type::not_eof (c);

    if (next_ != nullptr &&
        traits_type::eq_int_type (next_->sputc (traits_type::to_char_type (c)),
                                  traits_type::eof ()))
      return traits_type::eof ();

    progress_.update (1, 0);
    return c;
  }

  streamsize progress_streambuf::
  xsputn (const char_type* s, streamsize n)
  {
    streamsize r (next_ != nullptr ? next_->sputn (s, n) : n);

    if (r > 0)
      progress_.update (static_cast<int64_t> (r), 0);

    return r;
  }

  int progress_streambuf::
  sync ()
  {
    return next_ != nullptr ? next_->pubsync () : 0;
  }
}
