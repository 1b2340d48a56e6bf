#include <progressmux/progress/progress-tracker.hxx>

#include <map>
#include <iomanip>
#include <sstream>

using namespace std;

namespace progressmux
{
  optional<ftxui::Color> terminal_tracker_traits::
  parse_color (const string& n)
  {
    using ftxui::Color;

    static const map<string, Color> colors {
      {"black",   Color::Black},
      {"red",     Color::Red},
      {"green",   Color::Green},
      {"yellow",  Color::Yellow},
      {"blue",    Color::Blue},
      {"magenta", Color::Magenta},
      {"cyan",    Color::Cyan},
      {"white",   Color::White},
      {"gray",    Color::GrayLight}};

    auto i (colors.find (n));
    if (i == colors.end ())
      return nullopt;

    return i->second;
  }

  string terminal_tracker_traits::
  render_line (const progress_config& c,
               size_t n,
               size_t t,
               bool x)
  {
    using namespace ftxui;

    // An empty bar is as done as it will ever be.
    //
    float r (t == 0 ? 1.0f : static_cast<float> (n) / static_cast<float> (t));
    if (r > 1.0f)
      r = 1.0f;

    int pct (static_cast<int> (r * 100));

    // Fixed-width stats so the gauge doesn't jitter as the numbers grow.
    //
    ostringstream s;
    s << ' ' << setw (3) << pct << "% "
      << setw (static_cast<int> (to_string (t).size ())) << n << '/' << t;

    if (x)
      s << " (cancelled)";

    Element e (hbox ({
      text (c.description),
      gauge (r) | flex,
      text (s.str ())
    }));

    if (optional<Color> col = parse_color (c.color))
      e = e | color (*col);

    auto scr (Screen::Create (Dimension::Fixed (static_cast<int> (c.line_width)),
                              Dimension::Fixed (1)));

    Render (scr, e);
    return scr.ToString ();
  }
}
