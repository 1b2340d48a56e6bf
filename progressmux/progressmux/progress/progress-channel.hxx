#pragma once

#include <cstddef>
#include <optional>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>

namespace progressmux
{
  namespace asio = boost::asio;

  // Ordered multi-producer, single-consumer update channel.
  //
  // This is a thin veneer over Asio's concurrent channel that gives the
  // coordinators the handful of operations they need and hides the
  // completion token plumbing. Messages from one producer are received in the
  // order they were sent; messages from different producers interleave in
  // arrival order.
  //
  // The channel is bounded. A full channel makes send() block the calling
  // thread until the consumer drains it, which means send() must never be
  // called from a thread that runs the consumer's executor (use async_send()
  // from coroutines on that executor instead).
  //
  template <typename M>
  class basic_update_channel
  {
  public:
    using message_type = M;
    using channel_type =
      asio::experimental::concurrent_channel<
        void (boost::system::error_code, message_type)>;

    basic_update_channel (asio::any_io_executor ex, std::size_t capacity)
      : channel_ (std::move (ex), capacity)
    {
    }

    basic_update_channel (const basic_update_channel&) = delete;
    basic_update_channel& operator= (const basic_update_channel&) = delete;

    // Enqueue a message, blocking while the channel is full. Return false if
    // the channel is (or becomes) closed, in which case the message is
    // dropped.
    //
    bool
    send (message_type m);

    // Enqueue a message if there is room. Return false otherwise.
    //
    bool
    try_send (message_type m);

    // Enqueue a message from a coroutine, suspending while the channel is
    // full.
    //
    asio::awaitable<bool>
    async_send (message_type m);

    // Wait for the next message. Return nullopt once the channel is closed
    // (the consumer should treat it as end of stream).
    //
    asio::awaitable<std::optional<message_type>>
    async_receive ();

    // Close the channel and fail every send still waiting on it. Closing
    // alone only wakes a waiting receiver: once the consumer is gone
    // nobody would ever make room for a blocked sender again.
    //
    void
    close ()
    {
      channel_.close ();
      channel_.cancel ();
    }

    bool
    is_open () const
    {
      return channel_.is_open ();
    }

  private:
    channel_type channel_;
  };
}

#include <progressmux/progress/progress-channel.txx>
