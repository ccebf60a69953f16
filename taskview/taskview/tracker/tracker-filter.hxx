#pragma once

#include <string>
#include <cstdint>

#include <taskview/tracker/tracker-types.hxx>

namespace taskview
{
  // Alpha-beta filter over a position (bytes done) and its velocity
  // (bytes/sec).
  //
  // See https://en.wikipedia.org/wiki/Alpha_beta_filter for the details. The
  // state is only advanced by observations strictly later than the current
  // state time; see update() below.
  //
  struct alpha_beta_filter
  {
    double alpha;
    double beta;

    double x {0.0};  // Position.
    double v {0.0};  // Velocity.
    time_point t;    // Time of the state.

    alpha_beta_filter (double a, double b, time_point origin) noexcept
      : alpha (a), beta (b), t (origin)
    {
    }

    // Fold the observed position at time now into the state.
    //
    // Return false if the correction was deferred because now is not
    // strictly after the state time. Nothing is lost in that case: the
    // caller keeps accumulating the observed position and the next update
    // with a positive interval corrects for all of it at once.
    //
    bool
    update (time_point now, double observed) noexcept;
  };

  // Traits for byte tracker customization.
  //
  template <typename S = std::string>
  struct byte_tracker_traits
  {
    using string_type = S;

    // Filter gains. Alpha is the share of the position residual we trust,
    // beta the share that goes into the velocity.
    //
    static constexpr double alpha = 0.5;
    static constexpr double beta = 0.1;

    // Minimum remaining time (in seconds) worth showing as an ETA.
    //
    static constexpr double min_eta_seconds = 1.0;

    // Beyond this (a year) the transfer is as good as stalled and an ETA is
    // meaningless.
    //
    static constexpr double max_eta_seconds = 365.0 * 24 * 3600;
  };

  // Byte progress tracker.
  //
  // Accumulates relative (complete, total) updates and produces a smoothed
  // throughput and completion estimate. Not thread-safe: it is owned by the
  // aggregation loop.
  //
  template <typename T = byte_tracker_traits<>>
  class basic_byte_tracker_filter
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;

    // The origin is the time of the first sample, which keeps the first
    // filter interval from going negative when samples are stamped by
    // producers before the consumer gets to them.
    //
    explicit
    basic_byte_tracker_filter (time_point origin) noexcept
      : t_ (origin),
        filter_ (traits_type::alpha, traits_type::beta, origin)
    {
    }

    // Add relative progress observed at time t.
    //
    // Samples may arrive out of order; an older sample is counted but does
    // not rewind the observation time.
    //
    void
    add (time_point t, std::int64_t complete, std::int64_t total) noexcept;

    // Update the filter and format the current state.
    //
    // The long form is "<done>/<total> (<pct>%) <speed>", the short one is
    // "(<pct>%)". Both get an ", ETA <time>" suffix when there is enough
    // left to make it worth showing.
    //
    string_type
    format (bool short_form = false);

    // Format the final "<done> in <elapsed> (<average speed>)" summary.
    //
    string_type
    format_completed (duration_type elapsed) const;

    std::int64_t
    total () const noexcept
    {
      return total_;
    }

    std::int64_t
    completed () const noexcept
    {
      return complete_;
    }

    // Time of the most recent sample.
    //
    time_point
    last_time () const noexcept
    {
      return t_;
    }

    // Smoothed throughput in bytes/sec (never negative).
    //
    double
    speed () const noexcept
    {
      return filter_.v > 0.0 ? filter_.v : 0.0;
    }

    // Completion percentage (0 if the total is unknown).
    //
    double
    percentage () const noexcept;

    // Estimated seconds left (0 if unknown or nothing is left).
    //
    double
    eta_seconds () const noexcept;

    // Advance the filter to the most recent sample. Return false if the
    // update was deferred.
    //
    bool
    update () noexcept
    {
      return filter_.update (t_, static_cast<double> (complete_));
    }

  private:
    std::int64_t total_ {0};
    std::int64_t complete_ {0};
    time_point t_;

    alpha_beta_filter filter_;
  };

  using byte_tracker_filter = basic_byte_tracker_filter<>;
}

#include <taskview/tracker/tracker-filter.txx>
