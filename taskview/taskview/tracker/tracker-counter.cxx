#include <taskview/tracker/tracker-counter.hxx>

#include <iomanip>
#include <sstream>

using namespace std;

namespace taskview
{
  string task_counter::
  format (bool s) const
  {
    if (total_ == 0)
      return string ();

    ostringstream o;
    o << '[' << completed_ << '/' << total_;

    if (!s)
    {
      double r (static_cast<double> (completed_) /
                static_cast<double> (total_));

      o << " (" << fixed << setprecision (2) << (r * 100.0) << "%)";
    }

    o << ']';
    return o.str ();
  }
}
