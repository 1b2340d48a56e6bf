#include <ostream>
#include <utility>

namespace progressmux
{
  template <typename T>
  basic_terminal_tracker<T>::
  basic_terminal_tracker (std::size_t total,
                          std::size_t offset,
                          progress_config config)
    : total_ (total),
      offset_ (offset),
      config_ (std::move (config))
  {
  }

  template <typename T>
  void basic_terminal_tracker<T>::
  advance ()
  {
    ++count_;
    update ();
  }

  template <typename T>
  void basic_terminal_tracker<T>::
  set_value (std::size_t n)
  {
    count_ = n;
    update ();
  }

  template <typename T>
  void basic_terminal_tracker<T>::
  finish ()
  {
    count_ = total_;
    update ();
  }

  template <typename T>
  void basic_terminal_tracker<T>::
  cancel ()
  {
    cancelled_ = true;
    update ();
  }

  template <typename T>
  void basic_terminal_tracker<T>::
  describe (std::string d)
  {
    config_.description = std::move (d);
    update ();
  }

  template <typename T>
  void basic_terminal_tracker<T>::
  recolor (std::string c)
  {
    config_.color = std::move (c);
    update ();
  }

  template <typename T>
  void basic_terminal_tracker<T>::
  update ()
  {
    if (!config_.enabled || closed_)
      return;

    bool last (cancelled_ || count_ >= total_);
    auto now (clock_type::now ());

    // Throttle intermediate states. Redrawing on every single advance is
    // what makes busy bars flicker (and chews through the terminal's
    // bandwidth when there are many of them).
    //
    if (!last && drawn_ && now - *drawn_ < config_.min_interval)
      return;

    drawn_ = now;
    closed_ = last;

    draw ();
  }

  template <typename T>
  void basic_terminal_tracker<T>::
  draw ()
  {
    std::ostream& o (config_.stream ());

    std::string l (
      traits_type::render_line (config_, count_, total_, cancelled_));

    for (std::size_t i (0); i != offset_; ++i)
      o << '\n';

    // Rewrite the line in place, clearing whatever a longer previous bar
    // might have left behind.
    //
    o << '\r' << l << "\x1b[K";

    if (offset_ != 0)
      o << "\x1b[" << offset_ << 'A';

    o << '\r';

    // Only the bar on the anchor line moves the cursor on for good. Bars
    // below it are stepped over by whoever owns the anchor.
    //
    if (closed_ && offset_ == 0)
      o << '\n';

    o.flush ();
  }
}
