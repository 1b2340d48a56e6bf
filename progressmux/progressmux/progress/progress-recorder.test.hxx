#pragma once

#include <progressmux/progress/progress-types.hxx>

#include <string>
#include <vector>
#include <cstddef>
#include <utility>

namespace progressmux
{
  // Tracker that draws nothing and remembers what was done to it.
  //
  class recording_tracker
  {
  public:
    recording_tracker (std::size_t total,
                       std::size_t offset,
                       progress_config config)
      : total_ (total), offset_ (offset), config_ (std::move (config))
    {
    }

    void
    advance ()
    {
      ++count_;
      events.push_back ("next");
    }

    void
    set_value (std::size_t n)
    {
      count_ = n;
      events.push_back ("value " + std::to_string (n));
    }

    void
    finish ()
    {
      count_ = total_;
      events.push_back ("finish");
    }

    void
    cancel ()
    {
      cancelled_ = true;
      events.push_back ("cancel");
    }

    void
    describe (std::string d)
    {
      config_.description = std::move (d);
      events.push_back ("describe " + config_.description);
    }

    void
    recolor (std::string c)
    {
      config_.color = std::move (c);
      events.push_back ("color " + config_.color);
    }

    std::size_t count () const noexcept {return count_;}
    std::size_t total () const noexcept {return total_;}
    std::size_t offset () const noexcept {return offset_;}
    bool cancelled () const noexcept {return cancelled_;}

    const progress_config&
    config () const noexcept
    {
      return config_;
    }

    std::vector<std::string> events;

  private:
    std::size_t count_ {0};
    std::size_t total_;
    std::size_t offset_;
    progress_config config_;
    bool cancelled_ {false};
  };
}
