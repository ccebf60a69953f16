#include <taskview/ui/ui-debug.hxx>

#include <ios>
#include <memory>
#include <variant>
#include <stdexcept>
#include <system_error>

#include <boost/json/object.hpp>
#include <boost/json/serialize.hpp>

#include <taskview/tracker/tracker-format.hxx>

using namespace std;

namespace taskview
{
  namespace json = boost::json;

  string
  debug_directory_name (const task_name& n)
  {
    if (n.empty ())
      return "ROOT_TASK";

    string s (display_name (n));

    for (char& c: s)
    {
      switch (c)
      {
      case '<': case '>': case ':': case '"': case '/':
      case '\\': case '|': case '?': case '*':
        c = '-';
        break;
      }
    }

    const char* ws (" \t\n\v\f\r");

    string::size_type b (s.find_first_not_of (ws));
    if (b == string::npos)
      throw invalid_argument ("directory name for task '" + display_name (n) +
                              "' is empty after sanitization");

    s = s.substr (b, s.find_last_not_of (ws) - b + 1);

    for (char& c: s)
      if (c == ' ')
        c = '_';

    if (s.size () > 255)
      throw invalid_argument ("directory name for task '" + display_name (n) +
                              "' is too long");

    return s;
  }

  // Number of threads in this process or nullopt if not available.
  //
  static optional<size_t>
  thread_count ()
  {
    error_code ec;
    fs::directory_iterator i ("/proc/self/task", ec);

    if (ec)
      return nullopt;

    size_t r (0);
    for (fs::directory_iterator e; i != e; i.increment (ec))
    {
      if (ec)
        return nullopt;

      ++r;
    }

    return r;
  }

  debug_ui::
  debug_ui (asio::io_context& ioc, fs::path d, logger l)
      : event_loop_ui (ioc, tick_interval, move (l)),
        dir_ (move (d))
  {
    fs::create_directories (dir_);

    fs::path f (dir_ / "logs.txt");

    out_.open (f);
    if (!out_)
      throw runtime_error ("unable to create " + f.string ());

    log_.trace (1, "writing debug output to " + dir_.string ());
  }

  void debug_ui::
  on_event (const event& e)
  {
    if (const auto* i = get_if<info_event> (&e.payload))
      on_info (e, *i);
    else if (const auto* p = get_if<progress_event> (&e.payload))
      on_progress (e, *p);
    else if (get<task_event> (e.payload).done)
      on_completed (e);
    else
      on_created (e);
  }

  void debug_ui::
  on_info (const event& e, const info_event& i)
  {
    registry_.on_info (e.name, i.message);
    write_json (files (e.name), e, "info", i.message);
  }

  void debug_ui::
  on_created (const event& e)
  {
    write_main (e.time, "Starting task: " + display_name (e.name) + '.');

    registry_.on_create (e.name, e.time);

    task_files& f (open_files (e.name));

    if (task_tracker* p = registry_.parent (e.name))
      write_counter (files (p->name), *p, e.time);

    write_json (f, e, "task", "Starting task");
  }

  void debug_ui::
  on_completed (const event& e)
  {
    write_main (e.time, "Completed task: " + display_name (e.name) + '.');

    task_tracker t (registry_.on_complete (e.name, e.time));

    if (task_tracker* p = registry_.parent (e.name))
      write_counter (files (p->name), *p, e.time);

    auto i (files_.find (name_key (e.name)));
    task_files& f (*i->second);

    write_json (f,
                e,
                "task",
                "Completed " + t.format_completed (e.time - t.created));

    close_files (f);
    files_.erase (i);
  }

  void debug_ui::
  on_progress (const event& e, const progress_event& p)
  {
    const task_tracker* t (registry_.find (e.name));

    // Let the registry diagnose the unknown task.
    //
    bool first (t != nullptr && !t->bytes);

    if (first)
      write_main (e.time,
                  "Adding progress to task: " + display_name (e.name) + '.');

    task_tracker& k (registry_.on_progress (e.name, p.complete, p.total,
                                            e.time));
    task_files& f (files (e.name));

    if (first)
    {
      f.progress.emplace (f.dir / "progress.csv");

      if (!*f.progress)
        throw runtime_error ("unable to create " +
                             (f.dir / "progress.csv").string ());

      *f.progress << "time,completed,total\n";
    }

    *f.progress << elapsed_ms (e.time) << ','
                << k.bytes->completed () << ','
                << k.bytes->total () << '\n';

    if (!*f.progress)
      throw ios_base::failure ("unable to write " +
                               (f.dir / "progress.csv").string ());
  }

  void debug_ui::
  on_tick (time_point t)
  {
    optional<size_t> n (thread_count ());

    write_main (t,
                "SYSTEM update. Threads: " +
                (n ? to_string (*n) : string ("unknown")));
  }

  void debug_ui::
  on_stop ()
  {
    // Tasks still open if the session was canceled or failed.
    //
    for (auto& p: files_)
      close_files (*p.second);

    files_.clear ();

    out_.close ();

    if (!out_)
      throw ios_base::failure ("unable to write " +
                               (dir_ / "logs.txt").string ());
  }

  debug_ui::task_files& debug_ui::
  open_files (const task_name& n)
  {
    unique_ptr<task_files> f (make_unique<task_files> ());
    f->dir = dir_ / debug_directory_name (n);

    fs::create_directories (f->dir);

    fs::path p (f->dir / "log.jsonl");

    f->log.open (p);
    if (!f->log)
      throw runtime_error ("unable to create " + p.string ());

    task_files& r (*f);
    files_[name_key (n)] = move (f);
    return r;
  }

  void debug_ui::
  close_files (task_files& f)
  {
    auto close = [&f] (ofstream& o, const char* n)
    {
      o.close ();

      if (!o)
        throw ios_base::failure ("unable to write " + (f.dir / n).string ());
    };

    close (f.log, "log.jsonl");

    if (f.counter)
      close (*f.counter, "counter.csv");

    if (f.progress)
      close (*f.progress, "progress.csv");
  }

  debug_ui::task_files& debug_ui::
  files (const task_name& n)
  {
    // The registry has validated the name so the files must be there.
    //
    return *files_.at (name_key (n));
  }

  void debug_ui::
  write_main (time_point t, const string& m)
  {
    out_ << timestamp (t) << ": " << m << '\n';

    if (!out_)
      throw ios_base::failure ("unable to write " +
                               (dir_ / "logs.txt").string ());
  }

  void debug_ui::
  write_json (task_files& f,
              const event& e,
              const char* type,
              const string& m)
  {
    json::object o;
    o["type"] = type;
    o["name"] = display_name (e.name);
    o["message"] = m;
    o["timestamp"] = timestamp (e.time);

    f.log << json::serialize (o) << '\n';

    if (!f.log)
      throw ios_base::failure ("unable to write " +
                               (f.dir / "log.jsonl").string ());
  }

  void debug_ui::
  write_counter (task_files& f, const task_tracker& t, time_point tm)
  {
    if (!f.counter)
    {
      f.counter.emplace (f.dir / "counter.csv");

      if (!*f.counter)
        throw runtime_error ("unable to create " +
                             (f.dir / "counter.csv").string ());

      *f.counter << "time,completed,total\n";
    }

    *f.counter << elapsed_ms (tm) << ','
               << t.counter.completed () << ','
               << t.counter.total () << '\n';

    if (!*f.counter)
      throw ios_base::failure ("unable to write " +
                               (f.dir / "counter.csv").string ());
  }

  string debug_ui::
  timestamp (time_point t) const
  {
    return format_elapsed (elapsed (t));
  }
}
