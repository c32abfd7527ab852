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

#ifndef BTCZMQ_ASYNC_CONTEXT_HPP
#define BTCZMQ_ASYNC_CONTEXT_HPP

#include <functional>
#include <memory>
#include <system_error>
#include <utility>
#include <vector>

#include "error.hpp"
#include "expect.hpp"
#include "span.hpp"

namespace btczmq
{
namespace async
{
  //! Callable invoked when a pending task should be polled again.
  class waker
  {
    std::function<void()> wake_;

  public:
    waker() noexcept
      : wake_()
    {}

    explicit waker(std::function<void()> wake) noexcept
      : wake_(std::move(wake))
    {}

    //! Schedule the task for another poll. No-op if empty.
    void wake() const
    {
      if (wake_)
        wake_();
    }

    explicit operator bool() const noexcept { return bool(wake_); }
  };

  /*! Passed to every `poll` and `poll_next`. A pending task registers the
      ZMQ sockets it needs to be readable before it can make progress. An
      event loop services these with `zmq_poll` or `ZMQ_FD`, or calls
      `waker().wake()` from another thread. */
  class context
  {
    waker waker_;
    std::vector<void*> sockets_;

  public:
    explicit context(waker wake) noexcept
      : waker_(std::move(wake)), sockets_()
    {}

    context(context&&) = default;
    context(const context&) = delete;
    context& operator=(context&&) = default;
    context& operator=(const context&) = delete;

    const waker& get_waker() const noexcept { return waker_; }

    //! Task will be ready once `socket` has a readable message.
    void wait_readable(void* socket);

    //! \return Sockets registered since construction or the last `clear()`.
    span<void* const> sockets() const noexcept { return to_span(sockets_); }

    void clear() noexcept { sockets_.clear(); }
  };

  //! \return The failure returned by tasks that cannot make progress yet.
  inline failure pending() noexcept
  {
    return failure{std::make_error_code(std::errc::resource_unavailable_try_again)};
  }

  //! \return True if `error` indicates a pending task (`EAGAIN` in any category).
  inline bool is_pending(const failure& error) noexcept
  {
    return error.code() == std::errc::resource_unavailable_try_again;
  }

  template<typename T>
  bool is_pending(const expect<T>& result) noexcept
  {
    return !result && is_pending(result.error());
  }

  namespace detail
  {
    //! Self pipe used by `block_on` to wake `zmq_poll` from other threads.
    class wake_pipe
    {
      int read_;
      int write_;

      wake_pipe(int read, int write) noexcept
        : read_(read), write_(write)
      {}

    public:
      static expect<std::shared_ptr<wake_pipe>> make();

      wake_pipe(const wake_pipe&) = delete;
      wake_pipe& operator=(const wake_pipe&) = delete;
      ~wake_pipe() noexcept;

      int fd() const noexcept { return read_; }

      void notify() const noexcept;
      void drain() const noexcept;
    };

    //! Wait until a socket in `cx` is readable or `pipe` is notified.
    expect<void> wait(const context& cx, const wake_pipe& pipe);

    //! \return Context whose waker notifies `pipe`.
    context make_context(const std::shared_ptr<wake_pipe>& pipe);
  }

  /*! Drive `future` to completion on the calling thread.

      \param future has `expect<R> poll(context&)`.
      \return First non-pending result of `future.poll`. */
  template<typename F>
  auto block_on(F& future) -> decltype(future.poll(std::declval<context&>()))
  {
    auto pipe = detail::wake_pipe::make();
    if (!pipe)
      return pipe.error();

    for (;;)
    {
      context cx = detail::make_context(*pipe);
      auto out = future.poll(cx);
      if (!is_pending(out))
        return out;
      BTCZMQ_CHECK(detail::wait(cx, **pipe));
    }
  }

  /*! Wait for the next item of `stream` on the calling thread.

      \param stream has `expect<T> poll_next(context&)`.
      \return First non-pending result of `stream.poll_next`. */
  template<typename S>
  auto block_on_next(S& stream) -> decltype(stream.poll_next(std::declval<context&>()))
  {
    auto pipe = detail::wake_pipe::make();
    if (!pipe)
      return pipe.error();

    for (;;)
    {
      context cx = detail::make_context(*pipe);
      auto out = stream.poll_next(cx);
      if (!is_pending(out))
        return out;
      BTCZMQ_CHECK(detail::wait(cx, **pipe));
    }
  }
} // async
} // btczmq

#endif // BTCZMQ_ASYNC_CONTEXT_HPP
