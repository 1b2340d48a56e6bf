#pragma once

#include <set>
#include <cstddef>

namespace progressmux
{
  // Terminal line offset allocator.
  //
  // Offsets are handed out smallest-free-first starting from 1 (line 0
  // belongs to the aggregate bar). Released offsets below the current top
  // are kept in an ordered free set so that allocation never has to scan the
  // offsets in use.
  //
  class offset_pool
  {
  public:
    offset_pool () = default;

    // Allocate the smallest offset not currently in use.
    //
    std::size_t
    acquire ();

    // Return an offset to the pool. Releasing an offset that is not in use
    // is a logic error (std::logic_error).
    //
    void
    release (std::size_t offset);

    bool
    contains (std::size_t offset) const;

    // Number of offsets currently in use.
    //
    std::size_t
    size () const noexcept
    {
      return top_ - 1 - free_.size ();
    }

    bool
    empty () const noexcept
    {
      return size () == 0;
    }

    // Largest offset ever handed out (0 if none). This is how many lines
    // below the aggregate bar have been drawn on at some point.
    //
    std::size_t
    high_water () const noexcept
    {
      return high_water_;
    }

  private:
    std::size_t top_ {1};            // One past the largest offset in use.
    std::set<std::size_t> free_;     // Released offsets below top_.
    std::size_t high_water_ {0};
  };
}
