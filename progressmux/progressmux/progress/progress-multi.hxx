#pragma once

#include <progressmux/progress/progress-types.hxx>
#include <progressmux/progress/progress-channel.hxx>
#include <progressmux/progress/progress-offsets.hxx>
#include <progressmux/progress/progress-tracker.hxx>

#include <boost/asio.hpp>

#include <future>
#include <memory>
#include <string>
#include <vector>
#include <cstddef>
#include <optional>
#include <functional>

namespace progressmux
{
  namespace asio = boost::asio;

  // Multi progress traits for customization.
  //
  template <typename K = terminal_tracker>
  struct multi_progress_traits
  {
    using tracker_type = K;

    // The shared channel holds at least this many updates, or two per
    // worker if there are more workers than that.
    //
    static constexpr std::size_t min_capacity = 64;
  };

  // Per-worker bookkeeping. Owned by the consumer loop.
  //
  template <typename K>
  struct basic_worker_state
  {
    using tracker_type = K;

    std::optional<tracker_type> tracker;  // Disengaged until first update.
    std::optional<std::size_t> offset;    // Line assigned at materialization.
    bool finished {false};
    bool cancelled {false};

    bool
    materialized () const noexcept
    {
      return tracker.has_value ();
    }
  };

  // Coordinator state: the workers, the aggregate bar, and the line offsets.
  //
  // Nothing in here is synchronized. An instance is only ever mutated by one
  // consumer loop; everyone else talks to it through the channel.
  //
  template <typename K>
  class basic_multi_progress_state
  {
  public:
    using tracker_type = K;
    using worker_type = basic_worker_state<tracker_type>;

    // Throw std::invalid_argument if kws is not empty and its size differs
    // from that of lengths. An empty kws means no per-worker overrides.
    //
    basic_multi_progress_state (std::vector<std::size_t> lengths,
                                const progress_options& kw,
                                std::vector<progress_options> kws);

    // Apply one update. Throw std::logic_error if the worker id is out of
    // range. Updates for finished workers are ignored.
    //
    void
    apply (const worker_update&);

    // True once every bar is done: either the aggregate reached its total
    // or every worker finished (some by cancellation).
    //
    bool
    complete () const noexcept;

    // Move the cursor below all the bars and settle the aggregate. Called
    // once, by the consumer, when the state is complete or abandoned.
    //
    void
    close ();

    std::size_t
    amount () const noexcept
    {
      return lengths_.size ();
    }

    std::size_t
    length (worker_id i) const
    {
      return lengths_.at (i - 1);
    }

    const std::vector<std::size_t>&
    lengths () const noexcept
    {
      return lengths_;
    }

    const worker_type&
    worker (worker_id i) const
    {
      return workers_.at (i - 1);
    }

    const tracker_type&
    aggregate () const noexcept
    {
      return aggregate_;
    }

    const offset_pool&
    offsets () const noexcept
    {
      return offsets_;
    }

    std::size_t
    finished () const noexcept
    {
      return finished_;
    }

    bool
    closed () const noexcept
    {
      return closed_;
    }

  private:
    void
    materialize (worker_id, worker_type&);

    // Mark the worker finished and give its line back.
    //
    void
    retire (worker_type&);

    std::vector<std::size_t> lengths_;
    progress_config config_;
    std::vector<progress_options> kws_;   // Merged per-worker options.

    std::vector<worker_type> workers_;
    tracker_type aggregate_;
    offset_pool offsets_;

    std::size_t finished_ {0};
    bool closed_ {false};
  };

  // Per-worker update capability.
  //
  // Tags each update with the worker id and sends it over the shared
  // channel. Cheap to copy and safe to use from several threads at once.
  //
  template <typename C>
  class basic_worker_handle
  {
  public:
    using channel_type = C;

    basic_worker_handle (std::shared_ptr<channel_type> channel,
                         worker_id id,
                         std::size_t length)
      : channel_ (std::move (channel)), id_ (id), length_ (length)
    {
    }

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

    worker_id
    id () const noexcept
    {
      return id_;
    }

    std::size_t
    length () const noexcept
    {
      return length_;
    }

  private:
    bool
    send (update_message m);

    std::shared_ptr<channel_type> channel_;
    worker_id id_;
    std::size_t length_;
  };

  // Many progress bars, one per worker, plus one aggregate bar.
  //
  // All updates go through a single channel and are applied by a single
  // consumer coroutine running on a strand. That coroutine is the only
  // writer of the coordinator state (and of the terminal) so no locking is
  // needed anywhere. Each worker's bar is created on its first update at
  // the lowest free line below the aggregate, and the line is handed back as
  // soon as the worker completes, so the display grows with the number of
  // simultaneously active workers rather than the total.
  //
  // Note that a worker that stops sending updates keeps its line (and keeps
  // the coordinator running) forever. There are no timeouts.
  //
  template <typename T = multi_progress_traits<>>
  class basic_multi_progress
  {
  public:
    using traits_type = T;
    using tracker_type = typename traits_type::tracker_type;
    using state_type = basic_multi_progress_state<tracker_type>;
    using worker_type = typename state_type::worker_type;
    using channel_type = basic_update_channel<worker_update>;
    using handle_type = basic_worker_handle<channel_type>;

    // Observer invoked by the consumer after each applied update.
    //
    using update_callback =
      std::function<void (const state_type&, const worker_update&)>;

    // One bar per entry of lengths. The kw options apply to every bar
    // (including the aggregate) and kws[i] overrides them for worker i + 1.
    // Throw std::invalid_argument if kws is not empty and its size differs
    // from that of lengths.
    //
    basic_multi_progress (asio::io_context& ioc,
                          std::vector<std::size_t> lengths,
                          const progress_options& kw = {},
                          std::vector<progress_options> kws = {});

    // Amount workers of the same length.
    //
    basic_multi_progress (asio::io_context& ioc,
                          std::size_t amount,
                          std::size_t length,
                          const progress_options& kw = {},
                          std::vector<progress_options> kws = {});

    ~basic_multi_progress ();

    basic_multi_progress (const basic_multi_progress&) = delete;
    basic_multi_progress& operator= (const basic_multi_progress&) = delete;

    basic_multi_progress (basic_multi_progress&&) = delete;
    basic_multi_progress& operator= (basic_multi_progress&&) = delete;

    // Set the update observer. Must be called before start().
    //
    void
    on_update (update_callback f)
    {
      state_->callback = std::move (f);
    }

    // Spawn the consumer coroutine (non-blocking). Calling it again is a
    // no-op.
    //
    void
    start ();

    // Handle for worker i (1-based). Throw std::out_of_range otherwise.
    //
    handle_type
    operator[] (worker_id i) const;

    std::size_t
    amount () const noexcept
    {
      return state_->progress.amount ();
    }

    // Finish or cancel every worker.
    //
    void
    finish ();

    void
    cancel ();

    // Block until the consumer terminates, rethrowing anything it threw
    // (for example, an update for an unknown worker). Must not be called
    // from a thread that runs the io_context.
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

    // The state is owned by the consumer. Only look at it after join().
    //
    const state_type&
    state () const noexcept
    {
      return state_->progress;
    }

  private:
    struct shared_state
    {
      std::shared_ptr<channel_type> channel;
      state_type progress;
      update_callback callback;
      std::promise<void> promise;

      shared_state (std::shared_ptr<channel_type> c,
                    std::vector<std::size_t> lengths,
                    const progress_options& kw,
                    std::vector<progress_options> kws)
        : channel (std::move (c)),
          progress (std::move (lengths), kw, std::move (kws))
      {
      }
    };

    // Consumer loop (coroutine).
    //
    static asio::awaitable<void>
    run (std::shared_ptr<shared_state> s);

    static std::size_t
    capacity (std::size_t amount) noexcept;

    asio::io_context& ioc_;
    asio::strand<asio::io_context::executor_type> strand_;
    std::shared_ptr<shared_state> state_;
    std::shared_future<void> done_;
    bool started_ {false};
  };

  using multi_progress = basic_multi_progress<>;
  using worker_handle = multi_progress::handle_type;
}

#include <progressmux/progress/progress-multi.ixx>
#include <progressmux/progress/progress-multi.txx>
