#pragma once

#include <memory>
#include <string>
#include <fstream>
#include <optional>
#include <filesystem>
#include <unordered_map>

#include <taskview/ui/ui-loop.hxx>

namespace taskview
{
  namespace fs = std::filesystem;

  // Return the name of the debug directory for a task.
  //
  // The root task gets ROOT_TASK. Otherwise the display name is made safe
  // for use as a single path component: each of <>:"/\|?* is replaced with
  // '-', surrounding whitespace is trimmed, and spaces become '_'. Throw
  // invalid_argument if the result is empty or longer than 255 bytes.
  //
  std::string
  debug_directory_name (const task_name&);

  // UI that records every event with its timestamp for post-mortem
  // analysis.
  //
  // The directory receives logs.txt, the session log, and one
  // sub-directory per task containing log.jsonl (the task's messages as
  // JSON lines) along with counter.csv and progress.csv (the child and
  // byte progress of the task over time) once there is something to put
  // there.
  //
  class debug_ui: public event_loop_ui
  {
  public:
    static constexpr duration_type tick_interval = std::chrono::seconds (1);

    // Create the directory and logs.txt in it. Throw if either fails.
    //
    debug_ui (asio::io_context&, fs::path directory, logger = logger ());

    const fs::path&
    directory () const noexcept
    {
      return dir_;
    }

  protected:
    virtual void
    on_event (const event&) override;

    virtual void
    on_tick (time_point) override;

    virtual void
    on_stop () override;

  private:
    // Files of an open task.
    //
    struct task_files
    {
      fs::path dir;
      std::ofstream log;
      std::optional<std::ofstream> counter;
      std::optional<std::ofstream> progress;
    };

    void
    on_info (const event&, const info_event&);

    void
    on_created (const event&);

    void
    on_completed (const event&);

    void
    on_progress (const event&, const progress_event&);

    task_files&
    open_files (const task_name&);

    void
    close_files (task_files&);

    task_files&
    files (const task_name&);

    void
    write_main (time_point, const std::string&);

    void
    write_json (task_files&,
                const event&,
                const char* type,
                const std::string& message);

    void
    write_counter (task_files&, const task_tracker&, time_point);

    std::string
    timestamp (time_point) const;

    fs::path dir_;
    std::ofstream out_;
    std::unordered_map<std::string, std::unique_ptr<task_files>> files_;
  };
}
