#pragma once

#include <string>
#include <cstddef>

namespace taskview
{
  // Sub-task fan-out counter.
  //
  // The total is bumped once per child task created and the completed count
  // once per child task completed. A task whose counter is not done still
  // has open children.
  //
  class task_counter
  {
  public:
    task_counter () = default;

    std::size_t
    total () const noexcept
    {
      return total_;
    }

    std::size_t
    completed () const noexcept
    {
      return completed_;
    }

    void
    add_total (std::size_t n = 1) noexcept
    {
      total_ += n;
    }

    void
    add_completed (std::size_t n = 1) noexcept
    {
      completed_ += n;
    }

    bool
    done () const noexcept
    {
      return completed_ == total_;
    }

    // Format as "[c/t]" (short) or "[c/t (p%)]". Return an empty string if
    // no children were ever created.
    //
    std::string
    format (bool short_form = false) const;

  private:
    std::size_t total_ {0};
    std::size_t completed_ {0};
  };
}
