#include <chrono>
#include <ostream>
#include <string>
#include <numeric>
#include <utility>
#include <algorithm>
#include <exception>
#include <stdexcept>

#include <boost/asio/co_spawn.hpp>

namespace progressmux
{
  // basic_multi_progress_state
  //

  template <typename K>
  basic_multi_progress_state<K>::
  basic_multi_progress_state (std::vector<std::size_t> ls,
                              const progress_options& kw,
                              std::vector<progress_options> kws)
    : lengths_ (std::move (ls)),
      config_ (resolve (kw)),
      workers_ (lengths_.size ()),
      aggregate_ (std::accumulate (lengths_.begin (),
                                   lengths_.end (),
                                   std::size_t (0)),
                  0,
                  config_)
  {
    if (!kws.empty () && kws.size () != lengths_.size ())
      throw std::invalid_argument (
        "per-worker options count (" + std::to_string (kws.size ()) +
        ") does not match worker count (" +
        std::to_string (lengths_.size ()) + ")");

    // Pre-merge the per-worker overrides so that materialization is just a
    // resolve().
    //
    kws_.reserve (lengths_.size ());
    for (std::size_t i (0); i != lengths_.size (); ++i)
      kws_.push_back (kws.empty () ? kw : merge (kw, kws[i]));

    // A worker with nothing to do is done before it starts. It never gets a
    // bar (or a line).
    //
    for (std::size_t i (0); i != lengths_.size (); ++i)
    {
      if (lengths_[i] == 0)
      {
        workers_[i].finished = true;
        ++finished_;
      }
    }
  }

  template <typename K>
  void basic_multi_progress_state<K>::
  apply (const worker_update& u)
  {
    if (u.id == 0 || u.id > lengths_.size ())
      throw std::logic_error (
        "update for unknown worker " + std::to_string (u.id) + " (" +
        std::to_string (lengths_.size ()) + " workers)");

    worker_type& w (workers_[u.id - 1]);

    // Stale tail updates (say, a finish after the last next) are tolerated.
    //
    if (w.finished)
      return;

    if (!w.materialized ())
      materialize (u.id, w);

    tracker_type& t (*w.tracker);
    std::size_t n (lengths_[u.id - 1]);
    std::size_t c (t.count ());

    struct apply_update
    {
      worker_type& w;
      tracker_type& t;
      std::size_t n;

      void operator() (const next_update&) const
      {
        t.advance ();
      }

      // Clamp here rather than in the tracker: the aggregate is adjusted by
      // the difference, so an overshoot would leak into it.
      //
      void operator() (const value_update& v) const
      {
        t.set_value (std::min (v.value, n));
      }

      void operator() (const finish_update&) const
      {
        t.finish ();
      }

      void operator() (const cancel_update&) const
      {
        t.cancel ();
        w.cancelled = true;
      }

      void operator() (const describe_update& d) const
      {
        t.describe (d.description);
      }

      void operator() (const color_update& u) const
      {
        t.recolor (u.color);
      }
    };

    std::visit (apply_update {w, t, n}, u.message);

    // Carry the change over to the aggregate. The count may also go down
    // (set_value() to a smaller value), so be careful with the unsigned
    // arithmetic.
    //
    if (t.count () != c)
      aggregate_.set_value (aggregate_.count () - c + t.count ());

    if (w.cancelled || t.count () >= n)
      retire (w);
  }

  template <typename K>
  bool basic_multi_progress_state<K>::
  complete () const noexcept
  {
    return aggregate_.count () >= aggregate_.total () ||
           finished_ == lengths_.size ();
  }

  template <typename K>
  void basic_multi_progress_state<K>::
  close ()
  {
    if (closed_)
      return;

    closed_ = true;

    // Settle the aggregate bar. If we got here without reaching the total
    // then some workers were cancelled (or we are being abandoned).
    //
    if (aggregate_.count () >= aggregate_.total ())
      aggregate_.finish ();
    else
      aggregate_.cancel ();

    // Step over every line that has ever had a bar on it so that whatever
    // is printed next doesn't land on top of them.
    //
    if (config_.enabled)
    {
      std::ostream& o (config_.stream ());

      for (std::size_t i (0); i != offsets_.high_water (); ++i)
        o << '\n';

      o.flush ();
    }
  }

  template <typename K>
  void basic_multi_progress_state<K>::
  materialize (worker_id i, worker_type& w)
  {
    std::size_t o (offsets_.acquire ());

    w.offset = o;
    w.tracker.emplace (lengths_[i - 1], o, resolve (kws_[i - 1]));
  }

  template <typename K>
  void basic_multi_progress_state<K>::
  retire (worker_type& w)
  {
    w.finished = true;
    ++finished_;

    offsets_.release (*w.offset);
  }

  // basic_multi_progress
  //

  template <typename T>
  basic_multi_progress<T>::
  basic_multi_progress (asio::io_context& ioc,
                        std::vector<std::size_t> ls,
                        const progress_options& kw,
                        std::vector<progress_options> kws)
    : ioc_ (ioc),
      strand_ (asio::make_strand (ioc))
  {
    auto c (std::make_shared<channel_type> (strand_, capacity (ls.size ())));

    state_ = std::make_shared<shared_state> (std::move (c),
                                             std::move (ls),
                                             kw,
                                             std::move (kws));

    done_ = state_->promise.get_future ().share ();
  }

  template <typename T>
  basic_multi_progress<T>::
  basic_multi_progress (asio::io_context& ioc,
                        std::size_t amount,
                        std::size_t length,
                        const progress_options& kw,
                        std::vector<progress_options> kws)
    : basic_multi_progress (ioc,
                            std::vector<std::size_t> (amount, length),
                            kw,
                            std::move (kws))
  {
  }

  template <typename T>
  basic_multi_progress<T>::
  ~basic_multi_progress ()
  {
    if (started_ && !done ())
      state_->channel->close ();
  }

  template <typename T>
  std::size_t basic_multi_progress<T>::
  capacity (std::size_t n) noexcept
  {
    return std::max (2 * n, traits_type::min_capacity);
  }

  template <typename T>
  void basic_multi_progress<T>::
  start ()
  {
    if (started_)
      return;

    started_ = true;

    std::shared_ptr<shared_state> s (state_);

    asio::co_spawn (strand_,
                    run (s),
                    [s] (std::exception_ptr e)
    {
      if (e)
        s->promise.set_exception (e);
      else
        s->promise.set_value ();
    });
  }

  template <typename T>
  typename basic_multi_progress<T>::handle_type basic_multi_progress<T>::
  operator[] (worker_id i) const
  {
    const state_type& p (state_->progress);

    if (i == 0 || i > p.amount ())
      throw std::out_of_range (
        "worker " + std::to_string (i) + " out of range [1, " +
        std::to_string (p.amount ()) + "]");

    return handle_type (state_->channel, i, p.length (i));
  }

  template <typename T>
  void basic_multi_progress<T>::
  finish ()
  {
    for (worker_id i (1); i <= amount (); ++i)
      (*this)[i].finish ();
  }

  template <typename T>
  void basic_multi_progress<T>::
  cancel ()
  {
    for (worker_id i (1); i <= amount (); ++i)
      (*this)[i].cancel ();
  }

  template <typename T>
  void basic_multi_progress<T>::
  join ()
  {
    done_.get ();
  }

  template <typename T>
  bool basic_multi_progress<T>::
  done () const
  {
    return done_.wait_for (std::chrono::seconds (0)) ==
           std::future_status::ready;
  }

  template <typename T>
  asio::awaitable<void> basic_multi_progress<T>::
  run (std::shared_ptr<shared_state> s)
  {
    state_type& p (s->progress);
    channel_type& c (*s->channel);

    // Whatever happens, once we stop consuming nobody else should be
    // sending: close the channel on the way out so that later updates are
    // dropped instead of piling up (or blocking their senders forever).
    //
    struct closer
    {
      channel_type& c;

      ~closer ()
      {
        c.close ();
      }
    } cl {c};

    while (!p.complete ())
    {
      std::optional<worker_update> u (co_await c.async_receive ());

      // Closed underneath us (the coordinator went away).
      //
      if (!u)
        break;

      p.apply (*u);

      if (s->callback)
        s->callback (p, *u);
    }

    p.close ();
  }
}
