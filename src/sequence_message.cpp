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

#include "sequence_message.hpp"

#include <algorithm>
#include <stdexcept>

namespace btczmq
{
  void sequence_message::check_block() const
  {
    if (!is_block())
      throw std::logic_error{std::string{get_string(label_)} + " does not carry a block hash"};
  }

  void sequence_message::check_mempool() const
  {
    if (!is_mempool())
      throw std::logic_error{std::string{get_string(label_)} + " is not a mempool record"};
  }

  expect<sequence_message> sequence_message::from_bytes(const span<const std::uint8_t> source)
  {
    if (source.size() < block_length)
      return failure::sequence_message_length(source.size());

    bitcoin::hash256 hash{};
    std::reverse_copy(source.begin(), source.begin() + hash_length, hash.begin());

    const std::uint8_t kind = source[hash_length];
    switch (label(kind))
    {
    case label::block_connect:
    case label::block_disconnect:
      if (source.size() != block_length)
        return failure::sequence_message_length(source.size());
      return sequence_message{label(kind), hash, 0};
    case label::mempool_acceptance:
    case label::mempool_removal:
    {
      if (source.size() != mempool_length)
        return failure::sequence_message_length(source.size());

      std::uint64_t mempool_sequence = 0;
      for (std::size_t i = mempool_length; i > block_length; --i)
        mempool_sequence = (mempool_sequence << 8) | source[i - 1];
      return sequence_message{label(kind), hash, mempool_sequence};
    }
    default:
      break;
    }
    return failure::sequence_message_label(kind);
  }

  const bitcoin::hash256& sequence_message::blockhash() const
  {
    check_block();
    return hash_;
  }

  const bitcoin::hash256& sequence_message::txid() const
  {
    check_mempool();
    return hash_;
  }

  std::uint64_t sequence_message::mempool_sequence() const
  {
    check_mempool();
    return mempool_sequence_;
  }

  std::vector<std::uint8_t> sequence_message::to_bytes() const
  {
    std::vector<std::uint8_t> out{};
    out.reserve(raw_length());
    out.insert(out.end(), hash_.rbegin(), hash_.rend());
    out.push_back(std::uint8_t(label_));
    if (is_mempool())
    {
      for (unsigned i = 0; i < 8; ++i)
        out.push_back(std::uint8_t(mempool_sequence_ >> (i * 8)));
    }
    return out;
  }

  bool operator==(const sequence_message& lhs, const sequence_message& rhs) noexcept
  {
    if (lhs.kind() != rhs.kind() || lhs.hash() != rhs.hash())
      return false;
    return lhs.is_block() || lhs.mempool_sequence() == rhs.mempool_sequence();
  }

  const char* get_string(const sequence_message::label value) noexcept
  {
    switch (value)
    {
    default:
      break;
    case sequence_message::label::block_connect:
      return "BlockConnect";
    case sequence_message::label::block_disconnect:
      return "BlockDisconnect";
    case sequence_message::label::mempool_acceptance:
      return "MempoolAcceptance";
    case sequence_message::label::mempool_removal:
      return "MempoolRemoval";
    }
    return "Unknown";
  }

  std::string to_string(const sequence_message& src)
  {
    std::string out{get_string(src.kind())};
    out.push_back('(');
    out.append(bitcoin::to_string(src.hash()));
    if (src.is_mempool())
    {
      out.append(", mempool_sequence=");
      out.append(std::to_string(src.mempool_sequence()));
    }
    out.push_back(')');
    return out;
  }
}
