#include <taskview/ui/ui-event.hxx>

using namespace std;

namespace taskview
{
  static string
  join (const task_name& n, char s)
  {
    string r;

    for (auto b (n.begin ()), i (b); i != n.end (); ++i)
    {
      if (i != b)
        r += s;

      r += *i;
    }

    return r;
  }

  string
  display_name (const task_name& n)
  {
    return join (n, name_separator);
  }

  string
  name_key (const task_name& n)
  {
    return join (n, key_separator);
  }

  const char*
  event_kind (const event& e) noexcept
  {
    switch (e.payload.index ())
    {
    case 0: return "info";
    case 1: return "task";
    case 2: return "progress";
    }

    return "unknown";
  }
}
