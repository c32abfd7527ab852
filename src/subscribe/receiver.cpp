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

#include "subscribe/receiver.hpp"

#include <thread>
#include <utility>

#include "log.hpp"
#include "subscribe.hpp"

namespace btczmq
{
  namespace
  {
    struct receive_loop
    {
      connection conn;
      channel::sender<expect<message>> dest;

      void operator()()
      {
        receive_buffer buffer{};
        while (dest.push(receive_one(conn.socket.get(), buffer, 0)))
          ;
        log::get()->debug("Receiver dropped, subscription thread exiting");
      }
    };
  }

  expect<message> message_receiver::flatten(expect<expect<message>>&& item)
  {
    if (!item)
      return item.error();
    return std::move(*item);
  }

  expect<message> message_receiver::recv()
  {
    return flatten(source_.recv());
  }

  expect<message> message_receiver::recv_for(const std::chrono::milliseconds duration)
  {
    return flatten(source_.recv_for(duration));
  }

  expect<message> message_receiver::try_recv()
  {
    return flatten(source_.try_recv());
  }

  expect<message_receiver> subscribe_receiver(const std::vector<std::string>& endpoints)
  {
    auto conn = open(endpoints);
    if (!conn)
      return conn.error();

    auto ends = channel::make<expect<message>>();
    std::thread{receive_loop{std::move(*conn), std::move(ends.first)}}.detach();
    return message_receiver{std::move(ends.second)};
  }
}
