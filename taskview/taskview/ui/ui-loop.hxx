#pragma once

#include <memory>
#include <vector>
#include <exception>

#include <taskview/taskview-log.hxx>

#include <taskview/ui/ui.hxx>
#include <taskview/ui/ui-event.hxx>
#include <taskview/ui/ui-registry.hxx>
#include <taskview/tracker/tracker-types.hxx>

namespace taskview
{
  // Aggregation loop shared by the backends that render something.
  //
  // Producers post one handler per event onto the strand, so the strand's
  // handler queue is the event queue: it is unbounded, FIFO per producer,
  // and the strand is its only consumer. The registry and everything the
  // backend writes to is only touched from the strand and needs no locking.
  //
  // The task handles created from root() refer to this object, which must
  // therefore outlive them.
  //
  class event_loop_ui: public basic_ui
  {
  public:
    virtual task
    root () override;

    virtual asio::awaitable<void>
    run () override;

  protected:
    // If tick is zero then on_tick() is never called.
    //
    event_loop_ui (asio::io_context&, duration_type tick, logger);

    // Backend hooks, all called on the strand. Exceptions end the session
    // with the corresponding error.
    //

    virtual void
    on_start ()
    {
    }

    virtual void
    on_event (const event&) = 0;

    virtual void
    on_tick (time_point)
    {
    }

    // Called once the session is over, whatever the reason.
    //
    virtual void
    on_stop ()
    {
    }

    // Background work running alongside the loop (signal handling, etc).
    // Should return once interrupt() is called.
    //
    virtual asio::awaitable<void>
    background ()
    {
      co_return;
    }

    // Cancel the pending operations of background().
    //
    virtual void
    interrupt ()
    {
    }

    // Time since the loop was started. Events sent before that (and
    // buffered until the start) are reported at zero.
    //
    duration_type
    elapsed (time_point) const noexcept;

    std::int64_t
    elapsed_ms (time_point) const noexcept;

    task_registry registry_;
    time_point start_time_;
    logger log_;

  private:
    class queue;

    void
    dispatch (event);

    void
    process (const event&);

    asio::awaitable<void>
    loop ();

    asio::awaitable<void>
    watch ();

    asio::awaitable<void>
    tick_loop ();

    asio::awaitable<void>
    run_background ();

    duration_type tick_interval_;
    asio::steady_timer tick_;

    // Events sent before run() are held until the backend is started.
    //
    bool started_ {false};
    std::vector<event> pending_;
  };
}
