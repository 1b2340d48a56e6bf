#include <thread>
#include <random>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <iostream>
#include <exception>

#include <boost/asio.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <progressmux/progress/progress.hxx>
#include <progressmux/progressmux-options.hxx>

#include <progressmux/version.hxx>

using namespace std;
namespace asio = boost::asio;

namespace progressmux
{
  // Simulated workload settings, derived from the command line.
  //
  struct workload
  {
    size_t workers;
    size_t length;
    size_t jobs;
    chrono::milliseconds delay;
    size_t cancel;
    unsigned int seed;
  };

  // Sleep for a random fraction of the maximum step delay.
  //
  static void
  step (mt19937& g, chrono::milliseconds d)
  {
    if (d.count () == 0)
      return;

    uniform_int_distribution<long long> u (0, d.count ());
    this_thread::sleep_for (chrono::milliseconds (u (g)));
  }

  // Run the workload with one bar per worker plus the aggregate.
  //
  static int
  run_multi (const workload& w, const progress_options& kw)
  {
    asio::io_context ioc;

    // Give each bar its own description so that they can be told apart once
    // lines start getting reused.
    //
    vector<progress_options> kws (w.workers);
    for (size_t i (0); i != w.workers; ++i)
      kws[i].description = "worker " + to_string (i + 1) + ' ';

    multi_progress m (ioc, w.workers, w.length, kw, move (kws));
    m.start ();

    // The consumer gets a thread of its own. Workers must never send from
    // it: a full channel would then block the only thread that drains it.
    //
    thread t ([&ioc] {ioc.run ();});

    {
      asio::thread_pool pool (w.jobs);

      for (size_t i (1); i <= w.workers; ++i)
      {
        asio::post (pool, [h = m[i], &w] () mutable
        {
          mt19937 g (w.seed + static_cast<unsigned int> (h.id ()));

          bool c (w.cancel != 0 && h.id () % w.cancel == 0);

          for (size_t k (0); k != h.length (); ++k)
          {
            // Bail out halfway through, leaving the line to whoever
            // starts next.
            //
            if (c && k == h.length () / 2)
            {
              h.cancel ();
              return;
            }

            step (g, w.delay);
            h.next ();
          }
        });
      }

      pool.join ();
    }

    int r (0);

    try
    {
      m.join ();
    }
    catch (const exception& e)
    {
      cerr << "error: " << e.what () << endl;
      r = 1;
    }

    t.join ();
    return r;
  }

  // Run the workload with every worker driving the same bar.
  //
  static int
  run_single (const workload& w, const progress_options& kw)
  {
    asio::io_context ioc;

    single_progress s (ioc, w.workers * w.length, kw);
    s.start ();

    thread t ([&ioc] {ioc.run ();});

    {
      asio::thread_pool pool (w.jobs);

      for (size_t i (1); i <= w.workers; ++i)
      {
        asio::post (pool, [&s, &w, i]
        {
          mt19937 g (w.seed + static_cast<unsigned int> (i));

          for (size_t k (0); k != w.length; ++k)
          {
            step (g, w.delay);
            s.next ();
          }
        });
      }

      pool.join ();
    }

    int r (0);

    try
    {
      s.join ();
    }
    catch (const exception& e)
    {
      cerr << "error: " << e.what () << endl;
      r = 1;
    }

    t.join ();
    return r;
  }
}

int
main (int argc, char* argv[])
{
  using namespace progressmux;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      auto& o (cout);

      o << "progressmux " << PROGRESSMUX_VERSION_ID << "\n";

      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: progressmux [options]" << "\n"
        << "options:"                     << "\n";

      opt.print_usage (o);

      return 0;
    }

    if (opt.jobs () == 0)
    {
      cerr << "error: --jobs must be greater than zero" << endl;
      return 1;
    }

    if (opt.color_specified () &&
        !terminal_tracker_traits::parse_color (opt.color ()))
    {
      cerr << "error: unknown color '" << opt.color () << "'" << endl;
      return 1;
    }

    // Map the command line options to the workload and to the options shared
    // by all the bars.
    //
    workload w;
    w.workers = opt.workers ();
    w.length = opt.length ();
    w.jobs = opt.jobs ();
    w.delay = chrono::milliseconds (opt.delay ());
    w.cancel = opt.cancel ();
    w.seed = opt.seed ();

    progress_options kw;
    kw.description = opt.description ();
    kw.enabled = !opt.no_progress ();
    kw.line_width = opt.width ();

    if (opt.color_specified ())
      kw.color = opt.color ();

    if (opt.single () && w.cancel != 0)
      cerr << "warning: --cancel is ignored with --single" << endl;

    return opt.single () ? run_single (w, kw) : run_multi (w, kw);
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
