#include <taskview/taskview-log.hxx>

#include <mutex>

using namespace std;

namespace taskview
{
  // All loggers share the same underlying stream in practice (stderr), so a
  // single lock is enough.
  //
  static mutex log_mutex;

  logger logger::
  named (const string& s) const
  {
    logger r (*this);

    if (!r.name_.empty ())
      r.name_ += '|';

    r.name_ += s;
    return r;
  }

  void logger::
  trace (int l, const string& m) const
  {
    if (enabled (l))
      write ("trace: ", m);
  }

  void logger::
  warn (const string& m) const
  {
    if (os_ != nullptr)
      write ("warning: ", m);
  }

  void logger::
  write (const char* p, const string& m) const
  {
    lock_guard<mutex> l (log_mutex);

    *os_ << p;

    if (!name_.empty ())
      *os_ << name_ << ": ";

    *os_ << m << '\n';
  }
}
