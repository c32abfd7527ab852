// Copyright (c) 2019, The Monero Project
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

#ifndef BTCZMQ_ZMQ_HPP
#define BTCZMQ_ZMQ_HPP

#include <cerrno>
#include <cstdint>
#include <memory>
#include <system_error>
#include <vector>
#include <zmq.h>

#include "expect.hpp"
#include "span.hpp"

//! Return `::btczmq::zmq::get_error_code()` if `(__VA_ARGS__) < 0`.
#define BTCZMQ_ZMQ_CHECK(...)                          \
  do                                                   \
  {                                                    \
    if (( __VA_ARGS__ ) < 0)                           \
      return {::btczmq::zmq::get_error_code()};        \
  } while (0)

//! Throw an exception with a custom `msg`, current ZMQ error code, filename, and line number.
#define BTCZMQ_ZMQ_THROW(msg) \
  BTCZMQ_THROW( ::btczmq::zmq::get_error_code(), msg )

namespace btczmq
{
namespace zmq
{
  //! Every frame of one multipart message.
  using multipart = std::vector<std::vector<std::uint8_t>>;

  //! \return Category for ZMQ errors.
  const std::error_category& error_category() noexcept;

  //! \return `code` (usually from zmq_errno()`) using `zmq::error_category()`.
  inline std::error_code make_error_code(int code) noexcept
  {
    return std::error_code{code, error_category()};
  }

  //! \return Error from `zmq_errno()` using `zmq::error_category()`.
  inline std::error_code get_error_code() noexcept
  {
    return make_error_code(zmq_errno());
  }

  /*! Calls `zmq_ctx_term` until it returns something other than `EINTR`.
      Must be the last handle released, after every socket. */
  struct terminate
  {
    static void call(void* ptr) noexcept;

    void operator()(void* ptr) const noexcept
    {
      if (ptr)
        call(ptr);
    }
  };

  //! Calls `zmq_close`
  struct close
  {
    void operator()(void* ptr) const noexcept
    {
      if (ptr)
        zmq_close(ptr);
    }
  };

  //! Unique ZMQ context handle, calls `zmq_ctx_term` on destruction.
  using context = std::unique_ptr<void, terminate>;

  //! Unique ZMQ socket handle, calls `zmq_close` on destruction.
  using socket = std::unique_ptr<void, close>;

  /*! Retry a ZMQ function on `EINTR` errors.

      \param op The ZMQ function to execute + retry
      \param args Forwarded to `op`. Must be resuable in case of retry.
      \return The non-negative result of `op`, or the `zmq_errno()` that
        was not `EINTR`. */
  template<typename F, typename... T>
  expect<int> retry_op(F op, T&&... args) noexcept(noexcept(op(args...)))
  {
    for (;;)
    {
      const int result = op(args...);
      if (0 <= result)
        return result;

      const int error = zmq_errno();
      if (error != EINTR)
        return make_error_code(error);
    }
  }

  //! \return New context.
  expect<context> make_context();

  //! \return New socket of `type` with `ZMQ_LINGER` set to zero.
  expect<socket> make_socket(void* ctx, int type);

  //! Connect `socket` to `address`.
  expect<void> connect(void* socket, const char* address);

  //! Subscribe `socket` to every topic (empty filter).
  expect<void> subscribe_all(void* socket);

  //! \return True if the last frame read from `socket` has more frames following.
  expect<bool> has_more(void* socket);

  /*! Read one frame from `socket` into `dest`. Frames larger than `dest`
      are truncated.

      \return Size of the frame, which can be larger than `dest.size()`. */
  expect<std::size_t> receive_frame(span<std::uint8_t> dest, void* socket, int flags);

  /*! Read every frame of the next message on `socket`. Only the first
      frame honours `flags`, remaining frames are read blocking (they are
      delivered atomically).

      \return Every frame of the message. */
  expect<multipart> receive(void* socket, int flags);

  //! Report `events` of `socket` to a `ZMQ_PAIR` socket connecting to `address`.
  expect<void> monitor(void* socket, const char* address, int events);

  /*! Block until one of `sockets` has a readable message or `fd` (if not
      negative) is readable. Returns early on `EINTR`. */
  expect<void> wait_for(span<void* const> sockets, int fd);
} // zmq
} // btczmq

#endif // BTCZMQ_ZMQ_HPP
