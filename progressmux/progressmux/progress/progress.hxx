#pragma once

#include <progressmux/progress/progress-types.hxx>
#include <progressmux/progress/progress-channel.hxx>
#include <progressmux/progress/progress-offsets.hxx>
#include <progressmux/progress/progress-tracker.hxx>
#include <progressmux/progress/progress-single.hxx>
#include <progressmux/progress/progress-multi.hxx>

namespace progressmux
{
  namespace progress
  {
    using progressmux::update_message;
    using progressmux::worker_update;
    using progressmux::progress_options;
    using progressmux::progress_config;

    using progressmux::offset_pool;
    using progressmux::terminal_tracker;
    using progressmux::single_progress;
    using progressmux::multi_progress;
    using progressmux::worker_handle;
  }
}
