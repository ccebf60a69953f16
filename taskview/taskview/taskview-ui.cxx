#include <taskview/taskview-ui.hxx>

#include <ostream>
#include <exception>

#include <boost/asio/experimental/parallel_group.hpp>

#include <taskview/ui/ui-debug.hxx>
#include <taskview/ui/ui-silent.hxx>
#include <taskview/ui/ui-simple.hxx>
#include <taskview/ui/ui-complex.hxx>

using namespace std;

namespace taskview
{
  using asio::experimental::wait_for_one_error;
  using asio::experimental::make_parallel_group;

  string
  to_string (ui_kind k)
  {
    switch (k)
    {
    case ui_kind::silent:  return "silent";
    case ui_kind::simple:  return "simple";
    case ui_kind::complex: return "complex";
    case ui_kind::debug:   return "debug";
    }

    return string ();
  }

  ostream&
  operator<< (ostream& os, ui_kind k)
  {
    return os << to_string (k);
  }

  ui_kind
  select_ui (const ui_options& o, bool terminal)
  {
    if (o.quiet)
      return ui_kind::silent;

    if (o.debug_path)
      return ui_kind::debug;

    if (terminal && !o.no_term)
      return ui_kind::complex;

    return ui_kind::simple;
  }

  unique_ptr<ui>
  make_ui (asio::io_context& ioc,
           const ui_options& o,
           ostream& out,
           int fd,
           logger l)
  {
    ui_kind k (select_ui (o, is_terminal (fd)));

    l.trace (1, "using " + to_string (k) + " ui");

    switch (k)
    {
    case ui_kind::silent:
      return make_unique<silent_ui> (ioc, move (l));
    case ui_kind::simple:
      return make_unique<simple_ui> (ioc, out, move (l));
    case ui_kind::complex:
      return make_unique<complex_ui> (ioc, out, fd, move (l));
    case ui_kind::debug:
      return make_unique<debug_ui> (ioc,
                                    filesystem::absolute (*o.debug_path),
                                    move (l));
    }

    return nullptr;
  }

  // Run the work and then wrap up the session.
  //
  static asio::awaitable<void>
  run_work (ui& u, task root, function<asio::awaitable<void> (task)> w)
  {
    exception_ptr e;

    try
    {
      co_await w (root);
    }
    catch (...)
    {
      e = current_exception ();
    }

    // On failure the task tree is most likely left half-open and completing
    // the root would only add a protocol error on top.
    //
    if (e)
    {
      u.cancel ();
      rethrow_exception (e);
    }

    root.complete ();
    u.shutdown ();
  }

  asio::awaitable<void>
  run_ui (ui& u, function<asio::awaitable<void> (task)> w)
  {
    auto ex (co_await asio::this_coro::executor);

    task root (u.root ());

    // If the backend fails first, the work is canceled and we report the
    // backend failure rather than the resulting cancellation.
    //
    auto [ord, ue, we] = co_await make_parallel_group (
      asio::co_spawn (ex, u.run (), asio::deferred),
      asio::co_spawn (ex, run_work (u, root, move (w)), asio::deferred)
    ).async_wait (wait_for_one_error (), asio::use_awaitable);

    if (ue && ord[0] == 0)
      rethrow_exception (ue);

    if (we)
      rethrow_exception (we);

    if (ue)
      rethrow_exception (ue);
  }
}
