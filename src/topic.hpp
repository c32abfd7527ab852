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

#ifndef BTCZMQ_TOPIC_HPP
#define BTCZMQ_TOPIC_HPP

#include <cstddef>
#include <cstdint>

#include "expect.hpp"
#include "span.hpp"

namespace btczmq
{
  //! Publish topics of the `bitcoind` ZMQ interface.
  enum class topic : std::uint8_t
  {
    hash_block = 0, //!< `hashblock`
    hash_tx,        //!< `hashtx`
    raw_block,      //!< `rawblock`
    raw_tx,         //!< `rawtx`
    sequence        //!< `sequence`
  };

  //! Length of the longest topic string (`hashblock` and `sequence`).
  constexpr const std::size_t topic_max_length = 9;

  //! \return Topic string, without null terminator in `as_bytes`.
  const char* get_string(topic value) noexcept;
  span<const std::uint8_t> as_bytes(topic value) noexcept;

  //! \return Topic matching `value` exactly, else `error::codec::unknown_topic`.
  expect<topic> topic_from_bytes(span<const std::uint8_t> value);
}

#endif // BTCZMQ_TOPIC_HPP
