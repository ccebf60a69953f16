#include <taskview/tracker/tracker-format.hxx>

#include <iomanip>
#include <sstream>

using namespace std;

namespace taskview
{
  string
  format_bytes (uint64_t b)
  {
    ostringstream o;

    // Select the appropriate unit (IEC standard). Plain bytes are printed
    // without a fraction since there is nothing to round.
    //
    if (b < 1024)
    {
      o << b << " B";
    }
    else if (b < 1024 * 1024)
    {
      o << fixed << setprecision (1) << (b / 1024.0) << " KiB";
    }
    else if (b < 1024 * 1024 * 1024)
    {
      o << fixed << setprecision (1) << (b / (1024.0 * 1024.0)) << " MiB";
    }
    else if (b < 1024ULL * 1024 * 1024 * 1024)
    {
      o << fixed << setprecision (1)
        << (b / (1024.0 * 1024.0 * 1024.0)) << " GiB";
    }
    else
    {
      o << fixed << setprecision (1)
        << (b / (1024.0 * 1024.0 * 1024.0 * 1024.0)) << " TiB";
    }

    return o.str ();
  }

  string
  format_speed (double bps)
  {
    // The filter may undershoot below zero right after a stall. A negative
    // throughput means nothing to the user so we show it as idle.
    //
    if (bps < 0.0)
      bps = 0.0;

    return format_bytes (static_cast<uint64_t> (bps)) + "/s";
  }

  string
  format_duration (int64_t s)
  {
    ostringstream o;

    if (s < 60)
    {
      o << s << "s";
    }
    else if (s < 3600)
    {
      int64_t m (s / 60);
      int64_t r (s % 60);

      o << m << "m";
      if (r > 0) o << ' ' << r << "s";
    }
    else
    {
      // Once we hit hours, second-level precision is mostly noise, so we
      // drop it.
      //
      int64_t h (s / 3600);
      int64_t m ((s % 3600) / 60);

      o << h << "h";
      if (m > 0) o << ' ' << m << "m";
    }

    return o.str ();
  }

  string
  format_elapsed (duration_type d)
  {
    using namespace std::chrono;

    // Round to the nearest millisecond first so that all the branches below
    // agree on the value.
    //
    int64_t ms (duration_cast<milliseconds> (d + microseconds (500)).count ());

    if (ms < 0)
      ms = 0;

    ostringstream o;

    if (ms < 1000)
    {
      o << ms << "ms";
      return o.str ();
    }

    int64_t h (ms / 3600000);
    int64_t m ((ms % 3600000) / 60000);
    int64_t s ((ms % 60000) / 1000);
    int64_t f (ms % 1000);

    if (h > 0)
      o << h << "h";

    if (h > 0 || m > 0)
      o << m << "m";

    o << s;

    if (f != 0)
      o << '.' << setfill ('0') << setw (3) << f;

    o << "s";
    return o.str ();
  }
}
