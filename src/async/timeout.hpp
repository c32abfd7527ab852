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

#ifndef BTCZMQ_ASYNC_TIMEOUT_HPP
#define BTCZMQ_ASYNC_TIMEOUT_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "async/context.hpp"
#include "async/stream.hpp"
#include "error.hpp"
#include "expect.hpp"
#include "log.hpp"

namespace btczmq
{
namespace async
{
  /*! Future that is ready after a duration. A detached thread sleeps, then
      marks the shared state done and wakes the waker from the last poll. */
  class sleep
  {
    struct state
    {
      std::mutex sync;
      waker last_waker;
      bool done = false;
    };

    std::shared_ptr<state> state_;

  public:
    //! Starts the timer thread.
    explicit sleep(std::chrono::milliseconds duration);

    sleep(sleep&&) = default;
    sleep(const sleep&) = delete;
    sleep& operator=(sleep&&) = default;
    sleep& operator=(const sleep&) = delete;

    //! \return Success once elapsed, else pending with the waker of `cx` kept.
    expect<void> poll(context& cx);
  };

  /*! Races `F` against a `sleep`. The first one ready wins, a timer win is
      `error::codec::timeout`. The losing future is not cancelled, it is
      destroyed with this object. */
  template<typename F>
  class timeout
  {
    F future_;
    sleep timer_;

  public:
    using result_type = decltype(std::declval<F&>().poll(std::declval<context&>()));

    timeout(F future, const std::chrono::milliseconds duration)
      : future_(std::move(future)), timer_(duration)
    {}

    timeout(timeout&&) = default;

    result_type poll(context& cx)
    {
      result_type out = future_.poll(cx);
      if (!is_pending(out))
        return out;

      if (timer_.poll(cx))
      {
        log::get()->debug("Timed out before completion");
        return {error::codec::timeout};
      }
      return out;
    }

    F& get() noexcept { return future_; }
  };

  //! \return `timeout` racing `future` against `duration`.
  template<typename F>
  timeout<F> with_timeout(F future, const std::chrono::milliseconds duration)
  {
    return timeout<F>{std::move(future), duration};
  }

  //! \return Handshake wait that fails with `error::codec::timeout` after `duration`.
  timeout<handshake_wait> subscribe_async_wait_handshake_timeout(
    const std::vector<std::string>& endpoints, std::chrono::milliseconds duration);
} // async
} // btczmq

#endif // BTCZMQ_ASYNC_TIMEOUT_HPP
