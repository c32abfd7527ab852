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

#include "async/context.hpp"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

#include "zmq.hpp"

namespace btczmq
{
namespace async
{
  void context::wait_readable(void* const socket)
  {
    if (std::find(sockets_.begin(), sockets_.end(), socket) == sockets_.end())
      sockets_.push_back(socket);
  }

namespace detail
{
  expect<std::shared_ptr<wake_pipe>> wake_pipe::make()
  {
    int fds[2] = {-1, -1};
    if (::pipe2(fds, O_NONBLOCK | O_CLOEXEC) != 0)
      return {std::error_code{errno, std::system_category()}};
    return {std::shared_ptr<wake_pipe>{new wake_pipe{fds[0], fds[1]}}};
  }

  wake_pipe::~wake_pipe() noexcept
  {
    ::close(read_);
    ::close(write_);
  }

  void wake_pipe::notify() const noexcept
  {
    // a full pipe already has a pending wakeup
    const char byte = 0;
    while (::write(write_, &byte, 1) < 0 && errno == EINTR)
      ;
  }

  void wake_pipe::drain() const noexcept
  {
    char buffer[64];
    for (;;)
    {
      const ssize_t read = ::read(read_, buffer, sizeof(buffer));
      if (read < 0 && errno == EINTR)
        continue;
      if (read <= 0)
        break;
    }
  }

  expect<void> wait(const context& cx, const wake_pipe& pipe)
  {
    BTCZMQ_CHECK(zmq::wait_for(cx.sockets(), pipe.fd()));
    pipe.drain();
    return success();
  }

  context make_context(const std::shared_ptr<wake_pipe>& pipe)
  {
    std::shared_ptr<wake_pipe> copy = pipe;
    return context{waker{[copy] { copy->notify(); }}};
  }
} // detail
} // async
} // btczmq
