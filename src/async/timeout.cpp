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

#include "async/timeout.hpp"

#include <thread>

namespace btczmq
{
namespace async
{
  sleep::sleep(const std::chrono::milliseconds duration)
    : state_(std::make_shared<state>())
  {
    const std::shared_ptr<state> shared = state_;
    std::thread{[shared, duration] ()
    {
      std::this_thread::sleep_for(duration);

      waker last{};
      {
        const std::lock_guard<std::mutex> lock{shared->sync};
        shared->done = true;
        last = std::move(shared->last_waker);
      }
      last.wake();
    }}.detach();
  }

  expect<void> sleep::poll(context& cx)
  {
    const std::lock_guard<std::mutex> lock{state_->sync};
    if (state_->done)
      return success();
    state_->last_waker = cx.get_waker();
    return pending();
  }

  timeout<handshake_wait> subscribe_async_wait_handshake_timeout(
    const std::vector<std::string>& endpoints, const std::chrono::milliseconds duration)
  {
    return timeout<handshake_wait>{subscribe_async_wait_handshake(endpoints), duration};
  }
} // async
} // btczmq
