#include <future>
#include <utility>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/asio/experimental/channel_error.hpp>

namespace progressmux
{
  template <typename M>
  bool basic_update_channel<M>::
  send (message_type m)
  {
    if (!channel_.is_open ())
      return false;

    // Fast path: there is room in the buffer (or a receiver waiting).
    //
    // Note that we pass the message as an lvalue so that it is only copied
    // on success and is still ours to hand over to the slow path.
    //
    if (channel_.try_send (boost::system::error_code (), m))
      return true;

    // Slow path: block until the consumer makes room. We cannot tell "full"
    // from "closed" by the try_send() result alone, so the closed case is
    // reported through the future.
    //
    std::future<void> f (
      channel_.async_send (boost::system::error_code (),
                           std::move (m),
                           asio::use_future));

    try
    {
      f.get ();
      return true;
    }
    catch (const boost::system::system_error& e)
    {
      if (e.code () == asio::experimental::error::channel_closed ||
          e.code () == asio::experimental::error::channel_cancelled)
        return false;

      throw;
    }
  }

  template <typename M>
  bool basic_update_channel<M>::
  try_send (message_type m)
  {
    return channel_.try_send (boost::system::error_code (), std::move (m));
  }

  template <typename M>
  asio::awaitable<bool> basic_update_channel<M>::
  async_send (message_type m)
  {
    auto [ec] = co_await channel_.async_send (
      boost::system::error_code (),
      std::move (m),
      asio::as_tuple (asio::use_awaitable));

    co_return !ec;
  }

  template <typename M>
  asio::awaitable<std::optional<typename basic_update_channel<M>::message_type>>
  basic_update_channel<M>::
  async_receive ()
  {
    auto [ec, m] = co_await channel_.async_receive (
      asio::as_tuple (asio::use_awaitable));

    // Closed (or cancelled) and drained: end of stream.
    //
    if (ec)
      co_return std::nullopt;

    co_return std::optional<message_type> (std::move (m));
  }
}
