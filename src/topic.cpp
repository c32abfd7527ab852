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

#include "topic.hpp"

namespace btczmq
{
  namespace
  {
    constexpr const topic all_topics[] = {
      topic::hash_block, topic::hash_tx, topic::raw_block, topic::raw_tx, topic::sequence
    };
  }

  const char* get_string(const topic value) noexcept
  {
    switch (value)
    {
    default:
      break;
    case topic::hash_block:
      return "hashblock";
    case topic::hash_tx:
      return "hashtx";
    case topic::raw_block:
      return "rawblock";
    case topic::raw_tx:
      return "rawtx";
    case topic::sequence:
      return "sequence";
    }
    return "";
  }

  span<const std::uint8_t> as_bytes(const topic value) noexcept
  {
    return strspan(get_string(value));
  }

  expect<topic> topic_from_bytes(const span<const std::uint8_t> value)
  {
    if (value.size() <= topic_max_length)
    {
      for (const topic known : all_topics)
      {
        if (equal(value, as_bytes(known)))
          return known;
      }
    }
    return failure::unknown_topic(value);
  }
}
