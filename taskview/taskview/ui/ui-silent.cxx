#include <taskview/ui/ui-silent.hxx>

using namespace std;

namespace taskview
{
  silent_ui::
  silent_ui (asio::io_context& ioc, logger l)
      : basic_ui (ioc), log_ (move (l))
  {
  }

  task silent_ui::
  root ()
  {
    return make_root_task (nullptr, log_);
  }

  asio::awaitable<void> silent_ui::
  run ()
  {
    co_await asio::co_spawn (strand_, loop (), asio::use_awaitable);
  }

  asio::awaitable<void> silent_ui::
  loop ()
  {
    co_await wait_finished ();

    if (exception_ptr e = error ())
      rethrow_exception (e);
  }
}
