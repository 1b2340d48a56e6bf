#pragma once

#include <progressmux/progress/progress-types.hxx>

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/color.hpp>
#include <ftxui/screen/screen.hpp>

#include <chrono>
#include <string>
#include <cstddef>
#include <optional>

namespace progressmux
{
  // Traits for terminal tracker customization.
  //
  struct terminal_tracker_traits
  {
    using clock_type = std::chrono::steady_clock;

    // Map a color name ("red", "green", etc) to an FTXUI color. Return
    // nullopt for the empty name (terminal default) and for names we don't
    // recognize.
    //
    static std::optional<ftxui::Color>
    parse_color (const std::string& name);

    // Render a single bar line into a string of escape sequences, exactly
    // config.line_width columns wide.
    //
    static std::string
    render_line (const progress_config& config,
                 std::size_t count,
                 std::size_t total,
                 bool cancelled);
  };

  // Progress bar drawn at a fixed line offset below the cursor.
  //
  // The tracker owns its numeric state and draws itself on every change
  // (throttled by config.min_interval, except for the final state). It does
  // no locking and no clamping: it is only ever driven by one coordinator
  // loop, which is responsible for keeping count within total.
  //
  // Drawing at offset N means moving N lines down, rewriting the line, and
  // moving back up, so the cursor always rests at the start of line 0. The
  // tracker at offset 0 moves to the next line once it is done.
  //
  template <typename T = terminal_tracker_traits>
  class basic_terminal_tracker
  {
  public:
    using traits_type = T;
    using clock_type = typename traits_type::clock_type;

    basic_terminal_tracker (std::size_t total,
                            std::size_t offset,
                            progress_config config);

    // Non-copyable but movable.
    //
    basic_terminal_tracker (const basic_terminal_tracker&) = delete;
    basic_terminal_tracker& operator= (const basic_terminal_tracker&) = delete;

    basic_terminal_tracker (basic_terminal_tracker&&) = default;
    basic_terminal_tracker& operator= (basic_terminal_tracker&&) = default;

    void
    advance ();

    void
    set_value (std::size_t count);

    void
    finish ();

    void
    cancel ();

    void
    describe (std::string description);

    // Change the bar color (a name understood by parse_color(), empty for
    // the default).
    //
    void
    recolor (std::string color);

    std::size_t
    count () const noexcept
    {
      return count_;
    }

    std::size_t
    total () const noexcept
    {
      return total_;
    }

    std::size_t
    offset () const noexcept
    {
      return offset_;
    }

    bool
    cancelled () const noexcept
    {
      return cancelled_;
    }

    const progress_config&
    config () const noexcept
    {
      return config_;
    }

  private:
    // Redraw unless throttled. Final states are always drawn.
    //
    void
    update ();

    void
    draw ();

    std::size_t count_ {0};
    std::size_t total_;
    std::size_t offset_;
    progress_config config_;

    bool cancelled_ {false};
    bool closed_ {false};   // Final state drawn.
    std::optional<typename clock_type::time_point> drawn_;
  };

  using terminal_tracker = basic_terminal_tracker<>;
}

#include <progressmux/progress/progress-tracker.txx>
