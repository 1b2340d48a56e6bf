#include <progressmux/progress/progress-tracker.hxx>

#include <chrono>
#include <string>
#include <cassert>
#include <sstream>

using namespace std;
using namespace progressmux;

static progress_config
config (ostream& os, chrono::milliseconds i = chrono::milliseconds (0))
{
  progress_config c;
  c.description = "disk ";
  c.output = &os;
  c.min_interval = i;
  return c;
}

static bool
contains (const string& s, const string& x)
{
  return s.find (x) != string::npos;
}

// A bar below the anchor line steps down to its line, redraws it, and
// climbs back up so that the cursor is where it started.
//
static void
test_offset ()
{
  ostringstream os;
  terminal_tracker t (3, 2, config (os));

  t.advance ();

  string s (os.str ());

  assert (s.compare (0, 3, "\n\n\r") == 0);
  assert (contains (s, "disk"));
  assert (contains (s, " 33% 1/3"));
  assert (contains (s, "\x1b[K\x1b[2A\r"));
  assert (s.back () == '\r');

  assert (t.count () == 1);
  assert (t.offset () == 2);
}

// The anchor line bar moves the cursor on to the next line once it is done,
// and nothing is drawn after that.
//
static void
test_anchor ()
{
  ostringstream os;
  terminal_tracker t (2, 0, config (os));

  t.advance ();
  assert (os.str ().compare (0, 1, "\r") == 0);
  assert (!contains (os.str (), "A\r"));
  assert (os.str ().back () == '\r');

  t.finish ();
  string s (os.str ());
  assert (contains (s, "100% 2/2"));
  assert (s.compare (s.size () - 2, 2, "\r\n") == 0);

  t.describe ("other ");
  assert (os.str () == s);
  assert (t.config ().description == "other ");

  t.recolor ("red");
  assert (os.str () == s);
  assert (t.config ().color == "red");
}

// Intermediate states are throttled, the final one never is.
//
static void
test_throttle ()
{
  ostringstream os;
  terminal_tracker t (10, 1, config (os, chrono::hours (1)));

  t.advance ();
  string s (os.str ());
  assert (!s.empty ());

  t.advance ();
  t.set_value (5);
  assert (os.str () == s);
  assert (t.count () == 5);

  t.set_value (10);
  assert (os.str ().size () > s.size ());
  assert (contains (os.str (), "10/10"));
}

static void
test_cancel ()
{
  ostringstream os;
  terminal_tracker t (4, 0, config (os));

  t.advance ();
  t.cancel ();

  assert (t.cancelled ());
  assert (t.count () == 1);
  assert (contains (os.str (), "(cancelled)"));

  string s (os.str ());
  t.advance ();
  assert (os.str () == s);
}

static void
test_disabled ()
{
  ostringstream os;
  progress_config c (config (os));
  c.enabled = false;

  terminal_tracker t (2, 1, c);
  t.advance ();
  t.finish ();

  assert (os.str ().empty ());
  assert (t.count () == 2);
}

static void
test_render ()
{
  progress_config c;
  c.line_width = 40;

  // Nothing to do is as good as done.
  //
  string s (terminal_tracker_traits::render_line (c, 0, 0, false));
  assert (contains (s, "100% 0/0"));

  // Counts are padded to the width of the total.
  //
  s = terminal_tracker_traits::render_line (c, 7, 120, false);
  assert (contains (s, "  5%   7/120"));

  assert (terminal_tracker_traits::parse_color ("red"));
  assert (terminal_tracker_traits::parse_color ("gray"));
  assert (!terminal_tracker_traits::parse_color (""));
  assert (!terminal_tracker_traits::parse_color ("chartreuse"));
}

int
main ()
{
  test_offset ();
  test_anchor ();
  test_throttle ();
  test_cancel ();
  test_disabled ();
  test_render ();
}
