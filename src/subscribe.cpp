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

#include "subscribe.hpp"

#include <memory>
#include <utility>

#include "log.hpp"

namespace btczmq
{
  expect<connection> make_connection()
  {
    auto ctx = zmq::make_context();
    if (!ctx)
    {
      log::get()->error("Failed to create ZMQ context: {}", ctx.error().message());
      return ctx.error();
    }

    auto socket = zmq::make_socket(ctx->get(), ZMQ_SUB);
    if (!socket)
    {
      log::get()->error("Failed to create SUB socket: {}", socket.error().message());
      return socket.error();
    }

    BTCZMQ_CHECK(zmq::subscribe_all(socket->get()));
    return connection{std::move(*ctx), std::move(*socket)};
  }

  expect<void> connect_all(connection& conn, const std::vector<std::string>& endpoints)
  {
    for (const std::string& endpoint : endpoints)
      BTCZMQ_CHECK(zmq::connect(conn.socket.get(), endpoint.c_str()));
    return success();
  }

  expect<connection> open(const std::vector<std::string>& endpoints)
  {
    auto conn = make_connection();
    if (!conn)
      return conn;
    BTCZMQ_CHECK(connect_all(*conn, endpoints));
    return conn;
  }

  receive_buffer::receive_buffer()
    : topic_(), sequence_(), data_(std::make_unique<std::uint8_t[]>(data_max_length))
  {}

  expect<raw_message> receive_raw(void* const socket, receive_buffer& buffer, const int flags)
  {
    const expect<std::size_t> topic_length = zmq::receive_frame(buffer.topic(), socket, flags);
    if (!topic_length)
      return topic_length.error();

    std::size_t lengths[3] = {*topic_length, 0, 0};
    const span<std::uint8_t> destinations[3] = {buffer.topic(), buffer.data(), buffer.sequence()};

    std::size_t count = 1;
    for (;;)
    {
      const expect<bool> more = zmq::has_more(socket);
      if (!more)
        return more.error();
      if (!*more)
        break;

      const span<std::uint8_t> dest = count < 3 ? destinations[count] : span<std::uint8_t>{};
      const expect<std::size_t> length = zmq::receive_frame(dest, socket, 0);
      if (!length)
        return length.error();
      if (count < 3)
        lengths[count] = *length;
      ++count;
    }

    if (count != 3)
    {
      log::get()->warn("Discarded multipart message with {} frames", count);
      return failure::multipart_length(count);
    }

    const span<std::uint8_t> topic_bytes = buffer.topic();
    if (topic_bytes.size() < lengths[0])
      return failure::unknown_topic(topic_bytes, lengths[0]);

    const expect<topic> kind = topic_from_bytes(topic_bytes.subspan(0, lengths[0]));
    if (!kind)
      return kind.error();

    if (data_max_length < lengths[1])
      return failure::data_length(lengths[1]);

    if (lengths[2] != sequence_length)
      return failure::sequence_length(lengths[2]);

    const span<std::uint8_t> sequence = buffer.sequence();
    const std::uint32_t value =
      std::uint32_t(sequence[0]) |
      (std::uint32_t(sequence[1]) << 8) |
      (std::uint32_t(sequence[2]) << 16) |
      (std::uint32_t(sequence[3]) << 24);
    return raw_message{*kind, buffer.data().subspan(0, lengths[1]), value};
  }

  expect<message> receive_one(void* const socket, receive_buffer& buffer, const int flags)
  {
    const expect<raw_message> raw = receive_raw(socket, buffer, flags);
    if (!raw)
      return raw.error();
    return decode(*raw);
  }
}
