#pragma once

#include <progressmux/progress/progress-types.hxx>
#include <progressmux/progress/progress-channel.hxx>
#include <progressmux/progress/progress-tracker.hxx>

#include <boost/asio.hpp>

#include <future>
#include <memory>
#include <string>
#include <cstddef>

namespace progressmux
{
  namespace asio = boost::asio;

  // Single progress traits for customization.
  //
  template <typename K = terminal_tracker>
  struct single_progress_traits
  {
    using tracker_type = K;

    // Upper bound on the channel buffer. The buffer is otherwise sized to
    // the tracker total, so that a producer can run all the way through
    // without ever waiting on the display.
    //
    static constexpr std::size_t max_capacity = 4096;
  };

  // One progress bar that can be driven from any number of threads.
  //
  // The update operations just enqueue a message and return. A consumer
  // coroutine, spawned on a strand of the io_context by start(), applies
  // them to the tracker in order. It is the only code that ever touches the
  // tracker until the bar is done.
  //
  // The consumer terminates on finish, on cancel, or once the count reaches
  // the total. After that the channel is closed and further updates are
  // dropped (the update functions return false).
  //
  template <typename T = single_progress_traits<>>
  class basic_single_progress
  {
  public:
    using traits_type = T;
    using tracker_type = typename traits_type::tracker_type;
    using channel_type = basic_update_channel<update_message>;

    basic_single_progress (asio::io_context& ioc,
                           std::size_t total,
                           const progress_options& options = {});

    // Closes the channel if the consumer is still running, which makes it
    // terminate at its next wakeup. Does not wait for it.
    //
    ~basic_single_progress ();

    basic_single_progress (const basic_single_progress&) = delete;
    basic_single_progress& operator= (const basic_single_progress&) = delete;

    basic_single_progress (basic_single_progress&&) = delete;
    basic_single_progress& operator= (basic_single_progress&&) = delete;

    // Spawn the consumer coroutine (non-blocking). Calling it again is a
    // no-op.
    //
    void
    start ();

    // Updates. Each may block briefly if the channel is full and returns
    // false if the bar is already done.
    //
    bool
    next ();

    bool
    set_value (std::size_t count);

    bool
    finish ();

    bool
    cancel ();

    bool
    describe (std::string description);

    bool
    recolor (std::string color);

    // Block until the consumer terminates, rethrowing anything it threw.
    // Must not be called from a thread that runs the io_context.
    //
    void
    join ();

    bool
    done () const;

    asio::io_context&
    io_context () noexcept
    {
      return ioc_;
    }

    // The tracker is owned by the consumer. Only look at it after join().
    //
    const tracker_type&
    tracker () const noexcept
    {
      return state_->tracker;
    }

  private:
    struct state
    {
      channel_type channel;
      tracker_type tracker;
      std::promise<void> promise;

      state (asio::any_io_executor ex,
             std::size_t capacity,
             std::size_t total,
             progress_config config)
        : channel (std::move (ex), capacity),
          tracker (total, 0, std::move (config))
      {
      }
    };

    // Consumer loop (coroutine). Shares ownership of the state so that it
    // can outlive the coordinator object.
    //
    static asio::awaitable<void>
    run (std::shared_ptr<state> s);

    bool
    send (update_message m);

    asio::io_context& ioc_;
    asio::strand<asio::io_context::executor_type> strand_;
    std::shared_ptr<state> state_;
    std::shared_future<void> done_;
    bool started_ {false};
  };

  using single_progress = basic_single_progress<>;
}

#include <progressmux/progress/progress-single.txx>
