// Copyright (c) 2020, Lee Clagett
//
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without modification, are
// permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this list of
//    conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice, this list
//    of conditions and the following disclaimer in the documentation and/or other
//    materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its contributors may be
//    used to endorse or promote products derived from this software without specific
//    prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
// MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL
// THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT,
// STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF
// THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#ifndef BTCZMQ_ASYNC_STREAM_HPP
#define BTCZMQ_ASYNC_STREAM_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "async/context.hpp"
#include "expect.hpp"
#include "message.hpp"
#include "monitor.hpp"
#include "subscribe.hpp"
#include "zmq.hpp"

namespace btczmq
{
namespace async
{
  //! Stream of data messages. `poll_next` never blocks.
  class message_stream
  {
    connection conn_;
    receive_buffer buffer_;

  public:
    explicit message_stream(connection conn)
      : conn_(std::move(conn)), buffer_()
    {}

    message_stream(message_stream&&) = default;

    /*! \return Next message or per-message failure. Pending if nothing is
        readable, with the SUB socket registered in `cx`. */
    expect<message> poll_next(context& cx);

    void* socket() const noexcept { return conn_.socket.get(); }
    void* zmq_context() const noexcept { return conn_.ctx.get(); }
  };

  //! A data message or a monitor event.
  class socket_message
  {
    message message_;
    monitor_message event_;
    bool is_event_;

  public:
    explicit socket_message(message value)
      : message_(std::move(value)), event_(), is_event_(false)
    {}

    explicit socket_message(monitor_message value)
      : message_(), event_(std::move(value)), is_event_(true)
    {}

    bool is_message() const noexcept { return !is_event_; }
    bool is_event() const noexcept { return is_event_; }

    //! \throw std::logic_error if `!is_message()`.
    const message& get_message() const;
    message&& take_message();

    //! \throw std::logic_error if `!is_event()`.
    const monitor_message& event() const;
  };

  //! \return `Message(<message>)` or `Event(<event>)` form.
  std::string to_string(const socket_message& src);

  /*! Stream of data messages and monitor events on the same connection.
      Monitor events are returned first. */
  class monitor_stream
  {
    message_stream messages_;
    zmq::socket monitor_; // destroyed before the context in `messages_`

  public:
    monitor_stream(message_stream messages, zmq::socket monitor) noexcept
      : messages_(std::move(messages)), monitor_(std::move(monitor))
    {}

    monitor_stream(monitor_stream&&) = default;

    //! \return Next event, else next message. Pending with both sockets registered.
    expect<socket_message> poll_next(context& cx);

    //! \return Next monitor event only. Pending with the monitor socket registered.
    expect<monitor_message> poll_monitor(context& cx);

    void* socket() const noexcept { return messages_.socket(); }
    void* monitor_socket() const noexcept { return monitor_.get(); }
  };

  /*! Future resolving to a `monitor_stream` once every endpoint completed
      a ZMTP handshake. Has no timeout of its own. */
  class handshake_wait
  {
    expect<monitor_stream> stream_;
    handshake_counter counter_;
    bool complete_;

  public:
    handshake_wait(expect<monitor_stream> stream, std::size_t endpoints)
      : stream_(std::move(stream)), counter_(endpoints), complete_(false)
    {}

    handshake_wait(handshake_wait&&) = default;

    /*! \return Stream once all handshakes succeeded, the setup or monitor
        failure, or pending. \throw std::logic_error if polled after it
        returned a non-pending result. */
    expect<monitor_stream> poll(context& cx);

    std::size_t pending_handshakes() const noexcept { return counter_.pending(); }
  };

  /*! Data messages of a `monitor_stream` with connection checking. Monitor
      events are dropped, except a `disconnected` which is reported once as
      `error::codec::disconnected`. Afterwards the stream is terminated. */
  class checked_stream
  {
    monitor_stream stream_;
    bool terminated_;

  public:
    explicit checked_stream(monitor_stream stream) noexcept
      : stream_(std::move(stream)), terminated_(false)
    {}

    checked_stream(checked_stream&&) = default;

    //! \return Next message, the disconnect, or `error::codec::terminated`.
    expect<message> poll_next(context& cx);

    bool is_terminated() const noexcept { return terminated_; }
  };

  //! \return Stream of messages from `endpoints`, no thread is started.
  expect<message_stream> subscribe_async(const std::vector<std::string>& endpoints);

  /*! \return Stream of messages and socket events from `endpoints`. The
      monitor is attached before connecting, so no handshake is missed. */
  expect<monitor_stream> subscribe_async_monitor(const std::vector<std::string>& endpoints);

  //! \return Future resolving once every one of `endpoints` completed a handshake.
  handshake_wait subscribe_async_wait_handshake(const std::vector<std::string>& endpoints);
} // async
} // btczmq

#endif // BTCZMQ_ASYNC_STREAM_HPP
