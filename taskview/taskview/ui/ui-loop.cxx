#include <taskview/ui/ui-loop.hxx>

#include <chrono>
#include <utility>

#include <boost/asio/experimental/parallel_group.hpp>

using namespace std;

namespace taskview
{
  using asio::experimental::wait_for_all;
  using asio::experimental::make_parallel_group;

  // Event sink that queues the events on the loop strand.
  //
  class event_loop_ui::queue: public event_sink
  {
  public:
    explicit
    queue (event_loop_ui& u)
      : ui_ (u)
    {
    }

    virtual void
    send (event e) override
    {
      event_loop_ui* u (&ui_);

      asio::post (u->strand_,
                  [u, e = move (e)] () mutable
      {
        u->dispatch (move (e));
      });
    }

  private:
    event_loop_ui& ui_;
  };

  event_loop_ui::
  event_loop_ui (asio::io_context& ioc, duration_type tick, logger l)
      : basic_ui (ioc),
        start_time_ (clock_type::now ()),
        log_ (move (l)),
        tick_interval_ (tick),
        tick_ (strand_)
  {
  }

  task event_loop_ui::
  root ()
  {
    return make_root_task (make_shared<queue> (*this), log_);
  }

  asio::awaitable<void> event_loop_ui::
  run ()
  {
    co_await asio::co_spawn (strand_, loop (), asio::use_awaitable);
  }

  duration_type event_loop_ui::
  elapsed (time_point t) const noexcept
  {
    return t > start_time_ ? t - start_time_ : duration_type::zero ();
  }

  int64_t event_loop_ui::
  elapsed_ms (time_point t) const noexcept
  {
    return chrono::duration_cast<chrono::milliseconds> (elapsed (t)).count ();
  }

  void event_loop_ui::
  dispatch (event e)
  {
    // After cancel() whatever is still queued is dropped.
    //
    if (canceled ())
      return;

    if (!started_)
    {
      pending_.push_back (move (e));
      return;
    }

    if (!finished ())
      process (e);
  }

  void event_loop_ui::
  process (const event& e)
  {
    try
    {
      on_event (e);
    }
    catch (const protocol_error& x)
    {
      log_.trace (1, string ("rejected ") + event_kind (e) + " event for '" +
                  display_name (e.name) + "': " + x.what ());

      finish (current_exception ());
    }
    catch (const exception&)
    {
      finish (current_exception ());
    }
  }

  asio::awaitable<void> event_loop_ui::
  loop ()
  {
    log_.trace (1, "starting event loop");

    start_time_ = clock_type::now ();

    try
    {
      on_start ();
    }
    catch (const exception&)
    {
      finish (current_exception ());
    }

    started_ = true;

    // Catch up with the events sent before we were started, including those
    // sent before a shutdown() that is already in effect. Stop at the first
    // error.
    //
    vector<event> es (move (pending_));
    pending_.clear ();

    for (const event& e: es)
    {
      if (error () != nullptr || canceled ())
        break;

      process (e);
    }

    if (!finished ())
    {
      // None of these coroutines throw: failures end the session through
      // finish() which in turn makes all of them return.
      //
      co_await make_parallel_group (
        asio::co_spawn (strand_, watch (), asio::deferred),
        asio::co_spawn (strand_, tick_loop (), asio::deferred),
        asio::co_spawn (strand_, run_background (), asio::deferred)
      ).async_wait (wait_for_all (), asio::use_awaitable);
    }

    exception_ptr e (error ());

    try
    {
      on_stop ();
    }
    catch (const exception& x)
    {
      // Don't let a secondary failure (typically while flushing the output)
      // mask the reason we are stopping.
      //
      if (e)
        log_.warn (string ("unable to stop cleanly: ") + x.what ());
      else
        e = current_exception ();
    }

    log_.trace (1, "event loop stopped");

    if (e)
      rethrow_exception (e);
  }

  asio::awaitable<void> event_loop_ui::
  watch ()
  {
    co_await wait_finished ();

    tick_.cancel ();
    interrupt ();
  }

  asio::awaitable<void> event_loop_ui::
  tick_loop ()
  {
    if (tick_interval_ <= duration_type::zero ())
      co_return;

    while (!finished ())
    {
      tick_.expires_after (tick_interval_);

      boost::system::error_code ec;
      co_await tick_.async_wait (asio::redirect_error (asio::use_awaitable,
                                                       ec));

      if (finished ())
        break;

      try
      {
        on_tick (clock_type::now ());
      }
      catch (const exception&)
      {
        finish (current_exception ());
      }
    }
  }

  asio::awaitable<void> event_loop_ui::
  run_background ()
  {
    try
    {
      co_await background ();
    }
    catch (const exception&)
    {
      finish (current_exception ());
    }
  }
}
