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

#include "async/stream.hpp"

#include <stdexcept>
#include <utility>

#include "log.hpp"

namespace btczmq
{
namespace async
{
  expect<message> message_stream::poll_next(context& cx)
  {
    expect<message> out = receive_one(socket(), buffer_, ZMQ_DONTWAIT);
    if (is_pending(out))
      cx.wait_readable(socket());
    return out;
  }

  const message& socket_message::get_message() const
  {
    if (is_event_)
      throw std::logic_error{"socket_message holds a monitor event"};
    return message_;
  }

  message&& socket_message::take_message()
  {
    if (is_event_)
      throw std::logic_error{"socket_message holds a monitor event"};
    return std::move(message_);
  }

  const monitor_message& socket_message::event() const
  {
    if (!is_event_)
      throw std::logic_error{"socket_message holds a data message"};
    return event_;
  }

  std::string to_string(const socket_message& src)
  {
    if (src.is_event())
      return "Event(" + to_string(src.event()) + ")";
    return "Message(" + to_string(src.get_message()) + ")";
  }

  expect<monitor_message> monitor_stream::poll_monitor(context& cx)
  {
    const expect<zmq::multipart> frames = zmq::receive(monitor_socket(), ZMQ_DONTWAIT);
    if (!frames)
    {
      if (is_pending(frames))
        cx.wait_readable(monitor_socket());
      return frames.error();
    }
    return monitor_message::from_multipart(*frames);
  }

  expect<socket_message> monitor_stream::poll_next(context& cx)
  {
    expect<monitor_message> event = poll_monitor(cx);
    if (event)
      return socket_message{std::move(*event)};
    if (!is_pending(event))
      return event.error();

    expect<message> next = messages_.poll_next(cx);
    if (!next)
      return next.error();
    return socket_message{std::move(*next)};
  }

  expect<monitor_stream> handshake_wait::poll(context& cx)
  {
    if (complete_)
      throw std::logic_error{"handshake_wait polled after completion"};

    if (!stream_ || counter_.done())
    {
      complete_ = true;
      return std::move(stream_);
    }

    for (;;)
    {
      const expect<monitor_message> event = stream_->poll_monitor(cx);
      if (is_pending(event))
        return pending();
      if (!event)
      {
        complete_ = true;
        return event.error();
      }

      log::get()->debug("{} while waiting for handshakes", to_string(*event));
      if (counter_.update(event->event))
      {
        log::get()->debug("All handshakes completed");
        complete_ = true;
        return std::move(stream_);
      }
    }
  }

  expect<message> checked_stream::poll_next(context& cx)
  {
    if (terminated_)
      return {error::codec::terminated};

    for (;;)
    {
      expect<socket_message> next = stream_.poll_next(cx);
      if (!next)
        return next.error();
      if (next->is_message())
        return next->take_message();

      const monitor_message& event = next->event();
      if (event.event.kind() == socket_event::type::disconnected)
      {
        log::get()->warn("Disconnected from {}", event.source_url);
        terminated_ = true;
        return failure::disconnected(event.source_url);
      }
    }
  }

  expect<message_stream> subscribe_async(const std::vector<std::string>& endpoints)
  {
    auto conn = open(endpoints);
    if (!conn)
      return conn.error();
    return message_stream{std::move(*conn)};
  }

  expect<monitor_stream> subscribe_async_monitor(const std::vector<std::string>& endpoints)
  {
    auto conn = make_connection();
    if (!conn)
      return conn.error();

    BTCZMQ_CHECK(zmq::monitor(conn->socket.get(), monitor_endpoint, ZMQ_EVENT_ALL));

    auto monitor = zmq::make_socket(conn->ctx.get(), ZMQ_PAIR);
    if (!monitor)
      return monitor.error();
    BTCZMQ_CHECK(zmq::connect(monitor->get(), monitor_endpoint));

    BTCZMQ_CHECK(connect_all(*conn, endpoints));
    return monitor_stream{message_stream{std::move(*conn)}, std::move(*monitor)};
  }

  handshake_wait subscribe_async_wait_handshake(const std::vector<std::string>& endpoints)
  {
    return handshake_wait{subscribe_async_monitor(endpoints), endpoints.size()};
  }
} // async
} // btczmq
