#include <progressmux/progress/progress-types.hxx>

#include <iostream>

using namespace std;

namespace progressmux
{
  ostream& progress_config::
  stream () const
  {
    return output != nullptr ? *output : cerr;
  }

  progress_options
  merge (const progress_options& b, const progress_options& o)
  {
    progress_options r (b);

    if (o.description)  r.description = o.description;
    if (o.color)        r.color = o.color;
    if (o.enabled)      r.enabled = o.enabled;
    if (o.output)       r.output = o.output;
    if (o.line_width)   r.line_width = o.line_width;
    if (o.min_interval) r.min_interval = o.min_interval;

    return r;
  }

  progress_config
  resolve (const progress_options& o)
  {
    progress_config r;

    if (o.description)  r.description = *o.description;
    if (o.color)        r.color = *o.color;
    if (o.enabled)      r.enabled = *o.enabled;
    if (o.output)       r.output = *o.output;
    if (o.line_width)   r.line_width = *o.line_width;
    if (o.min_interval) r.min_interval = *o.min_interval;

    return r;
  }
}
