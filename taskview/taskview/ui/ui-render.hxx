#pragma once

#include <string>
#include <vector>
#include <cstddef>

#include <taskview/ui/ui-registry.hxx>

namespace taskview
{
  // Clear the current terminal line and return the cursor to its start.
  //
  constexpr const char clear_line[] = "\r\033[K\r";

  // Separator between the status line fragments.
  //
  constexpr const char status_separator[] = " ‖ ";

  // Multi-line status block listing the progress of every open task (except
  // the root), in display order. Return an empty string if no task is open.
  //
  std::string
  render_status_block (task_registry&);

  // Status line fragment for one task.
  //
  struct status_fragment
  {
    std::string text;    // "<name> ↦ <progress>"
    std::size_t index;   // Position in the display order (selects the color).
    std::size_t width;   // Visible width.
  };

  // Select the status line fragments that fit in the specified terminal
  // width, separators included.
  //
  // Tasks without anything to report are skipped. Only the first four tasks
  // get the long progress form.
  //
  std::vector<status_fragment>
  status_fragments (task_registry&, std::size_t width);

  // Render the fragments as one line of ANSI-colored text. Return an empty
  // string if there are no fragments.
  //
  std::string
  render_status_line (const std::vector<status_fragment>&);
}
