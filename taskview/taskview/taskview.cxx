#include <string>
#include <vector>
#include <chrono>
#include <memory>
#include <ostream>
#include <utility>
#include <iostream>
#include <algorithm>
#include <exception>

#include <signal.h>

#include <boost/asio.hpp>
#include <boost/asio/experimental/parallel_group.hpp>

#include <taskview/taskview-ui.hxx>
#include <taskview/taskview-log.hxx>
#include <taskview/taskview-options.hxx>

#include <taskview/ui/ui-task.hxx>

#include <taskview/version.hxx>

namespace taskview
{
  using namespace std;

  using asio::experimental::wait_for_all;
  using asio::experimental::make_parallel_group;

  // Simulated transfer parameters.
  //
  static const size_t chunk_size (16 * 1024);
  static const chrono::milliseconds chunk_delay (20);

  // Fetch every jobs'th file starting with the k'th one.
  //
  static asio::awaitable<void>
  fetch_worker (progress fetch, size_t k, size_t jobs, size_t files)
  {
    auto ex (co_await asio::this_coro::executor);
    asio::steady_timer t (ex);

    const string chunk (chunk_size, 'x');

    for (size_t i (k); i < files; i += jobs)
    {
      progress p (fetch.subtask_with_progress ("file-" + to_string (i)));

      // Vary the sizes so the files don't all finish together.
      //
      size_t size ((i % 5 + 1) * 256 * 1024);
      p.update (0, static_cast<int64_t> (size));

      progress_streambuf sb (p);
      ostream os (&sb);

      for (size_t n (0); n < size; )
      {
        size_t c (min (chunk.size (), size - n));

        if (!os.write (chunk.data (), static_cast<streamsize> (c)))
          throw runtime_error ("unable to write file-" + to_string (i));

        n += c;

        t.expires_after (chunk_delay);
        co_await t.async_wait (asio::use_awaitable);
      }

      task v (p.subtask ("verify"));
      v.infof ("checksum of %zu bytes ok", size);
      v.complete ();

      p.complete ();
    }
  }

  static asio::awaitable<void>
  fetch_all (asio::thread_pool& pool, task root, size_t files, size_t jobs)
  {
    root.infof ("fetching %zu files with %zu jobs", files, jobs);

    progress fetch (root.subtask_with_progress ("fetch"));

    using op_type = decltype (
      asio::co_spawn (pool,
                      declval<asio::awaitable<void>> (),
                      asio::deferred));

    vector<op_type> ops;
    for (size_t k (0); k != jobs; ++k)
      ops.push_back (
        asio::co_spawn (pool,
                        fetch_worker (fetch, k, jobs, files),
                        asio::deferred));

    auto [ord, es] = co_await make_parallel_group (move (ops)).async_wait (
      wait_for_all (),
      asio::use_awaitable);

    for (const exception_ptr& e: es)
      if (e)
        rethrow_exception (e);

    fetch.complete ();
    root.info ("done");
  }
}

int
main (int argc, char* argv[])
{
  using namespace std;
  using namespace taskview;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      auto& o (cout);

      o << "taskview " << TASKVIEW_VERSION_ID << "\n";

      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: taskview [options]" << "\n"
        << "options:"                  << "\n";

      opt.print_usage (o);

      return 0;
    }

    if (opt.jobs () == 0)
    {
      cerr << "error: --jobs must be at least 1" << "\n";
      return 1;
    }

    ui_options uo;
    uo.quiet = opt.quiet ();
    uo.no_term = opt.no_term ();

    if (opt.debug_specified ())
      uo.debug_path = opt.debug ();

    logger log (cerr, opt.verbose (), "taskview");

    asio::io_context ioc;
    asio::thread_pool pool (opt.jobs ());

    unique_ptr<ui> u (make_ui (ioc, uo, cout, 1 /* stdout */, log));

    // Interrupting cancels the session: the fetch runs to completion in the
    // pool but nothing is rendered past that point.
    //
    asio::signal_set signals (ioc, SIGINT, SIGTERM);
    signals.async_wait (
      [&u] (const boost::system::error_code& ec, int)
      {
        if (!ec)
          u->cancel ();
      });

    size_t files (opt.files ());
    size_t jobs (opt.jobs ());

    int exit_code (0);

    asio::co_spawn (
      ioc,
      run_ui (*u,
              [&pool, files, jobs] (task root)
              {
                return fetch_all (pool, move (root), files, jobs);
              }),
      [&exit_code, &signals] (exception_ptr ex)
      {
        signals.cancel ();

        if (ex)
        {
          try { rethrow_exception (ex); }
          catch (const exception& e)
          {
            cerr << "error: " << e.what () << "\n";
            exit_code = 1;
          }
        }
      });

    ioc.run ();
    pool.join ();

    return exit_code;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
  catch (const exception& ex)
  {
    cerr << "error: " << ex.what () << "\n";
    return 1;
  }
}
