#pragma once

#include <string>
#include <vector>
#include <variant>
#include <cstdint>
#include <utility>

#include <taskview/tracker/tracker-types.hxx>

namespace taskview
{
  // Hierarchical task name. The root task has the empty name.
  //
  using task_name = std::vector<std::string>;

  // Separator used to display a name ("fetch|download").
  //
  constexpr char name_separator = '|';

  // Separator used to build registry keys. Segments may not contain it so
  // keys cannot collide.
  //
  constexpr char key_separator = '\0';

  std::string
  display_name (const task_name&);

  std::string
  name_key (const task_name&);

  // Event payloads.
  //
  struct info_event
  {
    std::string message;
  };

  struct task_event
  {
    bool done {false};  // False: task created, true: task completed.
  };

  struct progress_event
  {
    std::int64_t complete {0};  // Relative.
    std::int64_t total {0};     // Relative.
  };

  using event_payload = std::variant<info_event, task_event, progress_event>;

  // Event sent from a task handle to the aggregation loop.
  //
  struct event
  {
    time_point time;
    task_name name;
    event_payload payload;

    event (time_point t, task_name n, event_payload p)
      : time (t), name (std::move (n)), payload (std::move (p))
    {
    }
  };

  // Name of the payload kind, for diagnostics ("info", "task", "progress").
  //
  const char*
  event_kind (const event&) noexcept;

  // Destination of task events.
  //
  // Implementations must make send() safe to call from any number of
  // threads concurrently and must preserve the order of events sent by any
  // single thread.
  //
  class event_sink
  {
  public:
    virtual
    ~event_sink () = default;

    virtual void
    send (event) = 0;
  };
}
