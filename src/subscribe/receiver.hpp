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

#ifndef BTCZMQ_SUBSCRIBE_RECEIVER_HPP
#define BTCZMQ_SUBSCRIBE_RECEIVER_HPP

#include <chrono>
#include <string>
#include <vector>

#include "channel.hpp"
#include "expect.hpp"
#include "message.hpp"

namespace btczmq
{
  /*! Consuming end of a `subscribe_receiver` subscription. Destroying it
      stops the background thread after its next message. */
  class message_receiver
  {
    channel::receiver<expect<message>> source_;

    static expect<message> flatten(expect<expect<message>>&& item);

  public:
    explicit message_receiver(channel::receiver<expect<message>> source) noexcept
      : source_(std::move(source))
    {}

    //! \return Next message or failure, blocking until one arrives.
    expect<message> recv();

    //! \return Next message or failure, `error::codec::timeout` after `duration`.
    expect<message> recv_for(std::chrono::milliseconds duration);

    //! \return Next message or failure, `EAGAIN` if none is queued.
    expect<message> try_recv();
  };

  /*! Subscribe to `endpoints` on a detached background thread that pushes
      every message (or per-message failure) into an unbounded queue. The
      thread exits when the returned receiver has been destroyed.

      \return Receiving end, or the failure opening the connection. */
  expect<message_receiver> subscribe_receiver(const std::vector<std::string>& endpoints);
}

#endif // BTCZMQ_SUBSCRIBE_RECEIVER_HPP
