#include <chrono>
#include <utility>
#include <algorithm>
#include <exception>

#include <boost/asio/co_spawn.hpp>

namespace progressmux
{
  template <typename T>
  basic_single_progress<T>::
  basic_single_progress (asio::io_context& ioc,
                         std::size_t total,
                         const progress_options& o)
    : ioc_ (ioc),
      strand_ (asio::make_strand (ioc)),
      state_ (std::make_shared<state> (
                strand_,
                std::clamp<std::size_t> (total, 1, traits_type::max_capacity),
                total,
                resolve (o)))
  {
    done_ = state_->promise.get_future ().share ();
  }

  template <typename T>
  basic_single_progress<T>::
  ~basic_single_progress ()
  {
    if (started_ && !done ())
      state_->channel.close ();
  }

  template <typename T>
  void basic_single_progress<T>::
  start ()
  {
    if (started_)
      return;

    started_ = true;

    std::shared_ptr<state> s (state_);

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
  bool basic_single_progress<T>::
  next ()
  {
    return send (next_update {});
  }

  template <typename T>
  bool basic_single_progress<T>::
  set_value (std::size_t n)
  {
    return send (value_update {n});
  }

  template <typename T>
  bool basic_single_progress<T>::
  finish ()
  {
    return send (finish_update {});
  }

  template <typename T>
  bool basic_single_progress<T>::
  cancel ()
  {
    return send (cancel_update {});
  }

  template <typename T>
  bool basic_single_progress<T>::
  describe (std::string d)
  {
    return send (describe_update {std::move (d)});
  }

  template <typename T>
  bool basic_single_progress<T>::
  recolor (std::string c)
  {
    return send (color_update {std::move (c)});
  }

  template <typename T>
  bool basic_single_progress<T>::
  send (update_message m)
  {
    return state_->channel.send (std::move (m));
  }

  template <typename T>
  void basic_single_progress<T>::
  join ()
  {
    done_.get ();
  }

  template <typename T>
  bool basic_single_progress<T>::
  done () const
  {
    return done_.wait_for (std::chrono::seconds (0)) ==
           std::future_status::ready;
  }

  template <typename T>
  asio::awaitable<void> basic_single_progress<T>::
  run (std::shared_ptr<state> s)
  {
    tracker_type& t (s->tracker);

    // Apply one message, returning true if it ends the bar.
    //
    struct apply
    {
      tracker_type& t;

      bool operator() (const next_update&) const
      {
        t.advance ();
        return false;
      }

      bool operator() (const value_update& u) const
      {
        t.set_value (std::min (u.value, t.total ()));
        return false;
      }

      bool operator() (const finish_update&) const
      {
        t.finish ();
        return true;
      }

      bool operator() (const cancel_update&) const
      {
        t.cancel ();
        return true;
      }

      bool operator() (const describe_update& u) const
      {
        t.describe (u.description);
        return false;
      }

      bool operator() (const color_update& u) const
      {
        t.recolor (u.color);
        return false;
      }
    };

    // Once we stop consuming (normally or because the tracker threw) close
    // the channel so that senders fail instead of waiting on us forever.
    //
    struct closer
    {
      channel_type& c;

      ~closer ()
      {
        c.close ();
      }
    } cl {s->channel};

    while (t.count () < t.total ())
    {
      std::optional<update_message> m (co_await s->channel.async_receive ());

      // Closed underneath us (the coordinator went away).
      //
      if (!m)
        break;

      if (std::visit (apply {t}, *m))
        break;
    }
  }
}
