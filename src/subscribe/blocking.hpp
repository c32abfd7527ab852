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

#ifndef BTCZMQ_SUBSCRIBE_BLOCKING_HPP
#define BTCZMQ_SUBSCRIBE_BLOCKING_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "expect.hpp"
#include "message.hpp"
#include "subscribe.hpp"

namespace btczmq
{
  //! Result of a `subscribe_blocking` callback: keep going, or stop with a value.
  template<typename B>
  class control_flow
  {
    std::unique_ptr<B> value_;

    explicit control_flow(std::unique_ptr<B> value) noexcept
      : value_(std::move(value))
    {}

  public:
    using value_type = B;

    //! \return Request for the next message.
    static control_flow next() noexcept { return control_flow{nullptr}; }

    //! \return Request to stop the subscription, returning `value`.
    static control_flow stop(B value)
    {
      return control_flow{std::make_unique<B>(std::move(value))};
    }

    bool is_stop() const noexcept { return value_ != nullptr; }
    bool is_next() const noexcept { return !is_stop(); }

    //! \return Stop value. \throw std::logic_error if `!is_stop()`.
    B take()
    {
      if (!value_)
        throw std::logic_error{"control_flow::take called on next()"};
      B out{std::move(*value_)};
      value_.reset();
      return out;
    }
  };

  /*! Subscribe to `endpoints` and call `callback` with every message (or
      per-message failure) on the calling thread until it returns
      `control_flow<B>::stop`. Nothing is retried.

      \param callback invoked as `control_flow<B>(expect<message>)`.
      \return The stop value, or the failure opening the connection. */
  template<typename F>
  auto subscribe_blocking(const std::vector<std::string>& endpoints, F callback)
    -> expect<typename std::result_of<F(expect<message>)>::type::value_type>
  {
    auto conn = open(endpoints);
    if (!conn)
      return conn.error();

    receive_buffer buffer{};
    for (;;)
    {
      auto flow = callback(receive_one(conn->socket.get(), buffer, 0));
      if (flow.is_stop())
        return flow.take();
    }
  }
}

#endif // BTCZMQ_SUBSCRIBE_BLOCKING_HPP
