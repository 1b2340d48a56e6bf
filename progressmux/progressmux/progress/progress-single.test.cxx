#include <progressmux/progress/progress-single.hxx>
#include <progressmux/progress/progress-recorder.test.hxx>

#include <string>
#include <thread>
#include <vector>
#include <cassert>

using namespace std;
using namespace progressmux;

namespace asio = boost::asio;

using progress = basic_single_progress<single_progress_traits<recording_tracker>>;
using events = vector<string>;

// The bar is done once the count reaches the total. Anything sent after
// that is dropped.
//
static void
test_complete ()
{
  asio::io_context ioc;
  progress p (ioc, 3);

  assert (p.next ());
  assert (p.next ());
  assert (p.next ());

  p.start ();
  ioc.run ();

  assert (p.done ());
  p.join ();

  assert (p.tracker ().count () == 3);
  assert (p.tracker ().offset () == 0);
  assert ((p.tracker ().events == events {"next", "next", "next"}));

  assert (!p.next ());
  assert (!p.finish ());
}

// Values past the total are clamped before they reach the tracker.
//
static void
test_clamp ()
{
  asio::io_context ioc;
  progress p (ioc, 5);

  p.set_value (2);
  p.set_value (10);

  p.start ();
  ioc.run ();
  p.join ();

  assert (p.tracker ().count () == 5);
  assert ((p.tracker ().events == events {"value 2", "value 5"}));
}

// Finish and cancel both end the bar early. Whatever was queued behind them
// is never applied.
//
static void
test_early_end ()
{
  {
    asio::io_context ioc;
    progress p (ioc, 10);

    p.next ();
    p.describe ("copy ");
    p.recolor ("red");
    p.finish ();
    p.next ();

    p.start ();
    ioc.run ();
    p.join ();

    assert (p.tracker ().count () == 10);
    assert (p.tracker ().config ().description == "copy ");
    assert (p.tracker ().config ().color == "red");
    assert ((p.tracker ().events ==
             events {"next", "describe copy ", "color red", "finish"}));
  }

  {
    asio::io_context ioc;
    progress p (ioc, 10);

    p.next ();
    p.cancel ();
    p.next ();

    p.start ();
    ioc.run ();
    p.join ();

    assert (p.tracker ().count () == 1);
    assert (p.tracker ().cancelled ());
    assert ((p.tracker ().events == events {"next", "cancel"}));

    assert (!p.next ());
  }
}

// Nothing to do: the consumer terminates without ever waiting.
//
static void
test_empty ()
{
  asio::io_context ioc;
  progress p (ioc, 0);
  assert (&p.io_context () == &ioc);

  p.start ();
  ioc.run ();

  assert (p.done ());
  assert (p.tracker ().events.empty ());
  assert (!p.next ());
}

// Many threads driving the same bar while the consumer runs on its own
// thread. The channel buffer is capped well below the amount of updates,
// so producers get to wait on it too.
//
static void
test_threads ()
{
  const size_t nt (4);
  const size_t nu (2500);

  asio::io_context ioc;
  progress p (ioc, nt * nu);
  p.start ();

  thread c ([&ioc] {ioc.run ();});

  vector<thread> ts;
  for (size_t i (0); i != nt; ++i)
  {
    ts.emplace_back ([&p]
    {
      for (size_t j (0); j != nu; ++j)
        p.next ();
    });
  }

  for (thread& t: ts)
    t.join ();

  p.join ();
  c.join ();

  assert (p.tracker ().count () == nt * nu);
  assert (p.tracker ().events.size () == nt * nu);
}

// More updates than the total from several threads. The bar is done long
// before the producers are, so some of them end up waiting on a full channel
// that nobody reads anymore. They must all be turned away rather than left
// waiting.
//
static void
test_overrun ()
{
  const size_t nt (4);

  asio::io_context ioc;
  progress p (ioc, 10);
  p.start ();

  thread c ([&ioc] {ioc.run ();});

  vector<thread> ts;
  for (size_t i (0); i != nt; ++i)
  {
    ts.emplace_back ([&p]
    {
      while (p.next ()) ;
    });
  }

  for (thread& t: ts)
    t.join ();

  p.join ();
  c.join ();

  assert (p.tracker ().count () == 10);
  assert (!p.next ());
}

// Going away while the consumer is still waiting must not leave it waiting
// forever.
//
static void
test_abandon ()
{
  asio::io_context ioc;

  {
    progress p (ioc, 10);
    p.start ();
    p.next ();
  }

  ioc.run ();
}

int
main ()
{
  test_complete ();
  test_clamp ();
  test_early_end ();
  test_empty ();
  test_threads ();
  test_overrun ();
  test_abandon ();
}
