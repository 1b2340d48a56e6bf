#include <progressmux/progress/progress-offsets.hxx>

#include <string>
#include <algorithm>
#include <stdexcept>

using namespace std;

namespace progressmux
{
  size_t offset_pool::
  acquire ()
  {
    size_t r;

    if (!free_.empty ())
    {
      auto i (free_.begin ());
      r = *i;
      free_.erase (i);
    }
    else
      r = top_++;

    high_water_ = max (high_water_, r);
    return r;
  }

  void offset_pool::
  release (size_t o)
  {
    if (!contains (o))
      throw logic_error ("releasing offset " + to_string (o) +
                         " that is not in use");

    // If this is the topmost offset, shrink the top and swallow any free
    // offsets that are now directly below it. Otherwise remember it as a
    // hole.
    //
    if (o + 1 == top_)
    {
      --top_;

      while (!free_.empty () && *free_.rbegin () + 1 == top_)
      {
        free_.erase (prev (free_.end ()));
        --top_;
      }
    }
    else
      free_.insert (o);
  }

  bool offset_pool::
  contains (size_t o) const
  {
    return o != 0 && o < top_ && free_.find (o) == free_.end ();
  }
}
