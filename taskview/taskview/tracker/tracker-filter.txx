#include <iomanip>
#include <sstream>

#include <taskview/tracker/tracker-format.hxx>

namespace taskview
{
  template <typename T>
  void basic_byte_tracker_filter<T>::
  add (time_point t, std::int64_t c, std::int64_t n) noexcept
  {
    total_ += n;
    complete_ += c;

    if (t_ < t)
      t_ = t;
  }

  template <typename T>
  double basic_byte_tracker_filter<T>::
  percentage () const noexcept
  {
    if (total_ <= 0)
      return 0.0;

    return static_cast<double> (complete_) /
           static_cast<double> (total_) * 100.0;
  }

  template <typename T>
  double basic_byte_tracker_filter<T>::
  eta_seconds () const noexcept
  {
    double v (speed ());

    if (v <= 0.0 || total_ <= complete_)
      return 0.0;

    return static_cast<double> (total_ - complete_) / v;
  }

  template <typename T>
  typename T::string_type basic_byte_tracker_filter<T>::
  format (bool s)
  {
    update ();

    std::ostringstream o;

    if (s)
    {
      o << '(' << std::fixed << std::setprecision (1) << percentage ()
        << "%)";
    }
    else
    {
      // Clamp for display: a negative total only happens if the producer
      // sent inconsistent deltas, and it would wrap around as unsigned.
      //
      std::uint64_t c (complete_ > 0 ? static_cast<std::uint64_t> (complete_)
                                     : 0);
      std::uint64_t n (total_ > 0 ? static_cast<std::uint64_t> (total_) : 0);

      o << format_bytes (c) << '/' << format_bytes (n)
        << " (" << std::fixed << std::setprecision (2) << percentage ()
        << "%) " << format_speed (speed ());
    }

    double eta (eta_seconds ());
    if (eta > traits_type::min_eta_seconds &&
        eta < traits_type::max_eta_seconds)
      o << ", ETA " << format_duration (static_cast<std::int64_t> (eta));

    return o.str ();
  }

  template <typename T>
  typename T::string_type basic_byte_tracker_filter<T>::
  format_completed (duration_type d) const
  {
    using namespace std::chrono;

    std::uint64_t c (complete_ > 0 ? static_cast<std::uint64_t> (complete_)
                                   : 0);

    double secs (duration<double> (d).count ());
    double avg (secs > 0.0 ? static_cast<double> (c) / secs : 0.0);

    std::ostringstream o;
    o << format_bytes (c) << " in " << format_elapsed (d)
      << " (" << format_speed (avg) << ')';

    return o.str ();
  }
}
