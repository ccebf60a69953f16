#pragma once

#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <streambuf>

#include <taskview/taskview-log.hxx>
#include <taskview/ui/ui-event.hxx>

namespace taskview
{
  class progress;

  // Task handle.
  //
  // Every call sends one event to the sink (the aggregation loop of the
  // active backend). A task without a sink (silent backend) drops all
  // events. Handles are cheap to copy and all methods are safe to call
  // concurrently from any thread.
  //
  class task
  {
  public:
    // Detached task: everything is dropped.
    //
    task () = default;

    task (task_name name, std::shared_ptr<event_sink> sink, logger log)
      : name_ (std::move (name)),
        sink_ (std::move (sink)),
        log_ (std::move (log))
    {
    }

    const task_name&
    name () const noexcept
    {
      return name_;
    }

    // Return true if events go somewhere.
    //
    bool
    attached () const noexcept
    {
      return sink_ != nullptr;
    }

    const logger&
    log () const noexcept
    {
      return log_;
    }

    // Informational message attached to this task.
    //
    void
    info (const std::string& message) const;

    // As above but with printf-style formatting.
    //
    [[gnu::format (printf, 2, 3)]] void
    infof (const char* format, ...) const;

    // Create a nested task.
    //
    // The segment must be non-empty, may not contain '\0', and must be
    // unique among the open children of this task. The returned task must
    // be completed exactly once.
    //
    task
    subtask (const std::string& segment) const;

    // Create a nested task that reports byte progress.
    //
    progress
    subtask_with_progress (const std::string& segment) const;

    // Complete this task.
    //
    // Must be called exactly once, after all of its children have been
    // completed.
    //
    void
    complete () const;

  protected:
    friend task
    make_root_task (std::shared_ptr<event_sink>, logger);

    void
    send (event_payload) const;

    void
    send (const task_name&, event_payload) const;

    // Derive the child handle without announcing it.
    //
    task
    derive (const std::string& segment) const;

    task_name name_;
    std::shared_ptr<event_sink> sink_;
    logger log_;
  };

  // Task handle with byte progress.
  //
  // A progress created from another progress aggregates into it: every
  // update is also applied to the ancestors it was derived from. We keep
  // the ancestors by name rather than by reference so a child never holds
  // on to a parent handle.
  //
  class progress: public task
  {
  public:
    progress () = default;

    // Create a nested progress that aggregates into this one.
    //
    progress
    subtask_with_progress (const std::string& segment) const;

    // Relative progress update.
    //
    void
    update (std::int64_t complete, std::int64_t total) const;

    // Byte sink: writing n bytes is equivalent to update (n, 0).
    //
    std::size_t
    write (const void* data, std::size_t size) const;

    // Names of the ancestors updates are aggregated into, nearest first.
    //
    const std::vector<task_name>&
    aggregate_to () const noexcept
    {
      return aggregate_;
    }

  private:
    friend class task;

    progress (task t, std::vector<task_name> aggregate)
      : task (std::move (t)), aggregate_ (std::move (aggregate))
    {
    }

    std::vector<task_name> aggregate_;
  };

  // Create the root task and announce it.
  //
  task
  make_root_task (std::shared_ptr<event_sink> sink, logger log);

  // Stream buffer that reports the bytes written through it to a progress.
  //
  // If a downstream buffer is specified, the bytes are forwarded to it and
  // only the bytes it accepts are reported. Unbuffered so that progress is
  // reported as the data flows.
  //
  class progress_streambuf: public std::streambuf
  {
  public:
    explicit
    progress_streambuf (progress p, std::streambuf* next = nullptr)
      : progress_ (std::move (p)), next_ (next)
    {
    }

  protected:
    virtual int_type
    overflow (int_type c) override;

    virtual std::streamsize
    xsputn (const char_type* s, std::streamsize n) override;

    virtual int
    sync () override;

  private:
    progress progress_;
    std::streambuf* next_;
  };
}
