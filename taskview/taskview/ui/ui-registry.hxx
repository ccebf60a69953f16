#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <unordered_map>

#include <taskview/ui/ui-event.hxx>
#include <taskview/tracker/tracker-types.hxx>
#include <taskview/tracker/tracker-filter.hxx>
#include <taskview/tracker/tracker-counter.hxx>

namespace taskview
{
  // Producer/consumer contract violation (duplicate task, completing a task
  // twice or with open children, using a task that does not exist, etc).
  //
  // This is a bug in the producing code, not a runtime condition, and the
  // aggregation loop terminates with it.
  //
  class protocol_error: public std::logic_error
  {
  public:
    protocol_error (std::string operation,
                    task_name name,
                    const std::string& what)
      : std::logic_error (what),
        operation_ (std::move (operation)),
        name_ (std::move (name))
    {
    }

    // The offending operation ("create", "complete", "info", "update").
    //
    const std::string&
    operation () const noexcept
    {
      return operation_;
    }

    const task_name&
    name () const noexcept
    {
      return name_;
    }

  private:
    std::string operation_;
    task_name name_;
  };

  // Bookkeeping for one open task.
  //
  struct task_tracker
  {
    task_name name;
    time_point created;
    task_counter counter;

    // Present once the task reported byte progress.
    //
    std::optional<byte_tracker_filter> bytes;

    task_tracker (task_name n, time_point t)
      : name (std::move (n)), created (t)
    {
    }

    // Current progress as "<counter> <bytes>" (either part may be absent).
    // Return an empty string if there is nothing to report.
    //
    std::string
    format_progress (bool short_counter, bool short_bytes);

    // Summary for the completion line: "[<children>] <bytes or time>".
    //
    std::string
    format_completed (duration_type elapsed) const;
  };

  // Registry of the open tasks.
  //
  // Owned by a single aggregation loop and never shared, hence no locking.
  // All the on_*() functions throw protocol_error if the event does not fit
  // the task lifecycle (unknown -> open -> closed).
  //
  class task_registry
  {
  public:
    // Open a task. Bump the parent's child total if the parent is open.
    //
    task_tracker&
    on_create (const task_name&, time_point);

    // Close a task and return its final state. The task must have no open
    // children. Bump the parent's completed count if the parent is open.
    //
    task_tracker
    on_complete (const task_name&, time_point);

    task_tracker&
    on_info (const task_name&, const std::string& message);

    // Add relative byte progress, setting up the byte tracker on the first
    // call.
    //
    task_tracker&
    on_progress (const task_name&,
                 std::int64_t complete,
                 std::int64_t total,
                 time_point);

    task_tracker*
    find (const task_name&);

    const task_tracker*
    find (const task_name&) const;

    // Return the tracker of the parent task or NULL if the task is the root
    // or the parent is not open.
    //
    task_tracker*
    parent (const task_name&);

    bool
    empty () const noexcept
    {
      return trackers_.empty ();
    }

    std::size_t
    size () const noexcept
    {
      return trackers_.size ();
    }

    // Open trackers, except the root, in display order: shallower names
    // first, then by the last segment.
    //
    std::vector<task_tracker*>
    ordered ();

  private:
    task_tracker&
    open (const task_name&, const char* operation, const std::string& detail);

    std::unordered_map<std::string, task_tracker> trackers_;
  };

  // Apply the event to the registry and return the text to append to a
  // line-oriented output (empty if there is nothing to print).
  //
  std::string
  process_event (task_registry&, const event&);
}
