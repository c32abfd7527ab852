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

#ifndef BTCZMQ_CHANNEL_HPP
#define BTCZMQ_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <system_error>
#include <utility>

#include "error.hpp"
#include "expect.hpp"

namespace btczmq
{
namespace channel
{
  namespace detail
  {
    template<typename T>
    struct state
    {
      std::mutex sync;
      std::condition_variable ready;
      std::deque<T> queue;
      bool sender_alive = true;
      bool receiver_alive = true;
    };
  }

  /*! Producing end of an unbounded FIFO. `push` fails once the matching
      `receiver` is destroyed. */
  template<typename T>
  class sender
  {
    std::shared_ptr<detail::state<T>> state_;

  public:
    explicit sender(std::shared_ptr<detail::state<T>> state) noexcept
      : state_(std::move(state))
    {}

    sender(sender&&) = default;
    sender(const sender&) = delete;
    sender& operator=(sender&&) = default;
    sender& operator=(const sender&) = delete;

    ~sender() noexcept
    {
      if (state_)
      {
        {
          const std::lock_guard<std::mutex> lock{state_->sync};
          state_->sender_alive = false;
        }
        state_->ready.notify_all();
      }
    }

    //! \return False if the receiver was destroyed.
    bool push(T value)
    {
      {
        const std::lock_guard<std::mutex> lock{state_->sync};
        if (!state_->receiver_alive)
          return false;
        state_->queue.push_back(std::move(value));
      }
      state_->ready.notify_one();
      return true;
    }
  };

  /*! Consuming end of an unbounded FIFO. Reports `error::codec::terminated`
      once the sender is gone and the queue is empty. */
  template<typename T>
  class receiver
  {
    std::shared_ptr<detail::state<T>> state_;

    expect<T> pop(std::unique_lock<std::mutex>& lock)
    {
      (void)lock;
      if (!state_->queue.empty())
      {
        T out{std::move(state_->queue.front())};
        state_->queue.pop_front();
        return {std::move(out)};
      }
      if (!state_->sender_alive)
        return {error::codec::terminated};
      return {std::make_error_code(std::errc::resource_unavailable_try_again)};
    }

    bool ready() const noexcept
    {
      return !state_->queue.empty() || !state_->sender_alive;
    }

  public:
    explicit receiver(std::shared_ptr<detail::state<T>> state) noexcept
      : state_(std::move(state))
    {}

    receiver(receiver&&) = default;
    receiver(const receiver&) = delete;
    receiver& operator=(receiver&&) = default;
    receiver& operator=(const receiver&) = delete;

    ~receiver() noexcept
    {
      if (state_)
      {
        const std::lock_guard<std::mutex> lock{state_->sync};
        state_->receiver_alive = false;
        state_->queue.clear();
      }
    }

    //! Block until an item is available or the sender is gone.
    expect<T> recv()
    {
      std::unique_lock<std::mutex> lock{state_->sync};
      state_->ready.wait(lock, [this] { return ready(); });
      return pop(lock);
    }

    //! Same as `recv`, but `error::codec::timeout` after `duration`.
    template<typename Rep, typename Period>
    expect<T> recv_for(const std::chrono::duration<Rep, Period> duration)
    {
      std::unique_lock<std::mutex> lock{state_->sync};
      if (!state_->ready.wait_for(lock, duration, [this] { return ready(); }))
        return {error::codec::timeout};
      return pop(lock);
    }

    //! \return Next item without blocking, `EAGAIN` if none is queued.
    expect<T> try_recv()
    {
      std::unique_lock<std::mutex> lock{state_->sync};
      return pop(lock);
    }
  };

  //! \return Connected ends of a new unbounded FIFO.
  template<typename T>
  std::pair<sender<T>, receiver<T>> make()
  {
    auto state = std::make_shared<detail::state<T>>();
    return {sender<T>{state}, receiver<T>{state}};
  }
} // channel
} // btczmq

#endif // BTCZMQ_CHANNEL_HPP
