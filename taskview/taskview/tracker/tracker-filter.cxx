#include <taskview/tracker/tracker-filter.hxx>

using namespace std;

namespace taskview
{
  bool alpha_beta_filter::
  update (time_point now, double observed) noexcept
  {
    double dt (chrono::duration<double> (now - t).count ());

    // Two samples within the same clock tick (or a sample older than the
    // state) give us no interval to derive a velocity from. Dividing by a
    // clamped epsilon instead would blow the velocity up by beta/epsilon, so
    // we leave the state as is and let the next proper interval absorb the
    // residual.
    //
    if (dt <= 0.0)
      return false;

    // Predict.
    //
    x += v * dt;

    // Correct.
    //
    double r (observed - x);

    x += alpha * r;
    v += beta / dt * r;
    t = now;

    return true;
  }

  // Explicit template instantiation.
  //
  template class basic_byte_tracker_filter<byte_tracker_traits<>>;
}
