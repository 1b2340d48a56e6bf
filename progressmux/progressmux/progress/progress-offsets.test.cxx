#include <progressmux/progress/progress-offsets.hxx>

#include <cassert>
#include <stdexcept>

using namespace std;
using namespace progressmux;

// Allocation is smallest-free-first starting at 1, since line 0 is where the
// aggregate bar lives.
//
static void
test_sequential ()
{
  offset_pool p;

  assert (p.empty ());
  assert (p.high_water () == 0);
  assert (!p.contains (0));

  assert (p.acquire () == 1);
  assert (p.acquire () == 2);
  assert (p.acquire () == 3);

  assert (p.size () == 3);
  assert (p.contains (2));
  assert (!p.contains (4));
  assert (p.high_water () == 3);
}

// Holes. A released offset in the middle must be the next one handed out,
// ahead of anything above the current top.
//
static void
test_reuse ()
{
  offset_pool p;

  for (int i (0); i < 4; ++i)
    p.acquire ();

  p.release (2);
  assert (!p.contains (2));
  assert (p.size () == 3);

  p.release (1);
  assert (p.acquire () == 1);
  assert (p.acquire () == 2);
  assert (p.acquire () == 5);

  assert (p.high_water () == 5);
}

// Releasing the topmost offset should fold the holes below it back into the
// unused range so that the next allocation starts low again.
//
static void
test_collapse ()
{
  offset_pool p;

  for (int i (0); i < 4; ++i)
    p.acquire ();

  p.release (2);
  p.release (3);
  p.release (4);

  assert (p.size () == 1);
  assert (p.contains (1));

  assert (p.acquire () == 2);
  assert (p.acquire () == 3);

  // The high-water mark never goes down.
  //
  assert (p.high_water () == 4);

  p.release (1);
  p.release (2);
  p.release (3);

  assert (p.empty ());
  assert (p.acquire () == 1);
}

// Double release is a caller bug and should not go unnoticed.
//
static void
test_invalid_release ()
{
  offset_pool p;
  p.acquire ();
  p.release (1);

  bool thrown (false);
  try
  {
    p.release (1);
  }
  catch (const logic_error&)
  {
    thrown = true;
  }
  assert (thrown);

  thrown = false;
  try
  {
    p.release (0);
  }
  catch (const logic_error&)
  {
    thrown = true;
  }
  assert (thrown);
}

int
main ()
{
  test_sequential ();
  test_reuse ();
  test_collapse ();
  test_invalid_release ();
}
