#pragma once

#include <atomic>
#include <exception>

#include <boost/asio.hpp>

#include <taskview/ui/ui-task.hxx>

namespace taskview
{
  namespace asio = boost::asio;

  // User interface abstraction.
  //
  // Decouples the code reporting what it is doing (through task handles)
  // from the presentation. Exactly one backend is active per session.
  //
  class ui
  {
  public:
    virtual
    ~ui () = default;

    // Create the root task.
    //
    // Call once per backend. The root must be completed after all the tasks
    // derived from it.
    //
    virtual task
    root () = 0;

    // Run the presentation.
    //
    // Complete normally once shutdown() has been requested and every event
    // sent before it has been processed. Throw system_error with
    // operation_aborted after cancel(), protocol_error if the producers
    // broke the task lifecycle, and the underlying error if the output
    // failed.
    //
    virtual asio::awaitable<void>
    run () = 0;

    // Request a clean shutdown: no more events will be sent. Thread-safe,
    // returns immediately.
    //
    virtual void
    shutdown () = 0;

    // Cancel the session: run() exits promptly and any event still queued
    // is dropped. Thread-safe, returns immediately.
    //
    virtual void
    cancel () = 0;
  };

  // Common backend machinery: the strand everything runs on and the
  // shutdown/cancel signalling.
  //
  // The backend must outlive the io_context run that drives it.
  //
  class basic_ui: public ui
  {
  public:
    using strand_type = asio::strand<asio::io_context::executor_type>;

    basic_ui (const basic_ui&) = delete;
    basic_ui& operator= (const basic_ui&) = delete;

    virtual void
    shutdown () override;

    virtual void
    cancel () override;

  protected:
    explicit
    basic_ui (asio::io_context&);

    // The following functions must be called on the strand.
    //

    // End the session with the specified error (or none). Only the first
    // error is kept. An error may still follow a clean finish, as happens
    // when the events queued before shutdown() are processed late.
    //
    void
    finish (std::exception_ptr);

    bool
    finished () const noexcept
    {
      return finished_;
    }

    // Suspend until finish() is called.
    //
    asio::awaitable<void>
    wait_finished ();

    // Error the session ended with, if any.
    //
    std::exception_ptr
    error () const noexcept
    {
      return error_;
    }

    // May be called from any thread.
    //
    bool
    canceled () const noexcept
    {
      return canceled_.load (std::memory_order_acquire);
    }

    strand_type strand_;

  private:
    asio::steady_timer done_;
    bool finished_ {false};
    std::exception_ptr error_;
    std::atomic<bool> canceled_ {false};
  };
}
