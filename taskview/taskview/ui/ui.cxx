#include <taskview/ui/ui.hxx>

#include <chrono>

using namespace std;

namespace taskview
{
  basic_ui::
  basic_ui (asio::io_context& ioc)
      : strand_ (asio::make_strand (ioc)),
        done_ (strand_)
  {
  }

  void basic_ui::
  shutdown ()
  {
    // Queue behind every event already sent so that they are all processed
    // before we stop.
    //
    asio::post (strand_, [this] {finish (nullptr);});
  }

  void basic_ui::
  cancel ()
  {
    // Flag first: the events still queued check it and are dropped without
    // being processed, so the finish below is reached right away.
    //
    canceled_.store (true, memory_order_release);

    asio::post (strand_,
                [this]
    {
      finish (make_exception_ptr (
                boost::system::system_error (asio::error::operation_aborted)));
    });
  }

  void basic_ui::
  finish (exception_ptr e)
  {
    if (finished_)
    {
      if (e != nullptr && error_ == nullptr)
        error_ = move (e);

      return;
    }

    finished_ = true;
    error_ = move (e);

    done_.cancel ();
  }

  asio::awaitable<void> basic_ui::
  wait_finished ()
  {
    // The timer never expires on its own, finish() cancels it.
    //
    while (!finished_)
    {
      done_.expires_at (asio::steady_timer::time_point::max ());

      boost::system::error_code ec;
      co_await done_.async_wait (asio::redirect_error (asio::use_awaitable,
                                                       ec));
    }

    co_return;
  }
}
