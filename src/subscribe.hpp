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

#ifndef BTCZMQ_SUBSCRIBE_HPP
#define BTCZMQ_SUBSCRIBE_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "error.hpp"
#include "expect.hpp"
#include "message.hpp"
#include "span.hpp"
#include "zmq.hpp"

namespace btczmq
{
  //! A ZMQ context and a SUB socket connected to every endpoint.
  struct connection
  {
    zmq::context ctx; // must be destroyed last
    zmq::socket socket;
  };

  //! \return New context and SUB socket with zero linger, subscribed to every topic.
  expect<connection> make_connection();

  //! Connect the socket of `conn` to each of `endpoints`.
  expect<void> connect_all(connection& conn, const std::vector<std::string>& endpoints);

  /*! Create a context and a SUB socket with zero linger, subscribe to every
      topic, and connect the socket to each of `endpoints`.

      \return Ready connection, or the first setup failure. */
  expect<connection> open(const std::vector<std::string>& endpoints);

  //! Scratch space for the framing loop. Never shared between loops.
  class receive_buffer
  {
    std::array<std::uint8_t, topic_capture_length> topic_;
    std::array<std::uint8_t, sequence_length> sequence_;
    std::unique_ptr<std::uint8_t[]> data_; //!< `data_max_length` bytes

  public:
    //! Allocates the data buffer once.
    receive_buffer();

    receive_buffer(receive_buffer&&) = default;
    receive_buffer(const receive_buffer&) = delete;
    receive_buffer& operator=(receive_buffer&&) = default;
    receive_buffer& operator=(const receive_buffer&) = delete;

    span<std::uint8_t> topic() noexcept { return {topic_.data(), topic_.size()}; }
    span<std::uint8_t> data() noexcept { return {data_.get(), data_max_length}; }
    span<std::uint8_t> sequence() noexcept { return {sequence_.data(), sequence_.size()}; }
  };

  /*! Read every frame of the next multipart message on `socket` into
      `buffer`. Only the first frame honours `flags`. The whole message is
      consumed before any error is returned, so the next call starts on a
      message boundary. Checks, in order: frame count, topic, data length,
      sequence length.

      \return View into `buffer`, valid until the next call with `buffer`. */
  expect<raw_message> receive_raw(void* socket, receive_buffer& buffer, int flags);

  //! \return Next message on `socket`, decoded.
  expect<message> receive_one(void* socket, receive_buffer& buffer, int flags);
}

#endif // BTCZMQ_SUBSCRIBE_HPP
