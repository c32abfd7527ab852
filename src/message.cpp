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

#include "message.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace btczmq
{
  namespace
  {
    //! \return Hash from a 32 byte frame in display order.
    expect<bitcoin::hash256> hash_from_frame(const frame data)
    {
      auto hash = bitcoin::hash256_from_bytes(data);
      if (hash)
        std::reverse(hash->begin(), hash->end());
      return hash;
    }

    std::vector<std::uint8_t> hash_to_frame(const bitcoin::hash256& hash)
    {
      return std::vector<std::uint8_t>(hash.rbegin(), hash.rend());
    }
  }

  std::vector<frame> to_frames(const zmq::multipart& src)
  {
    std::vector<frame> out{};
    out.reserve(src.size());
    for (const std::vector<std::uint8_t>& part : src)
      out.push_back(to_span(part));
    return out;
  }

  expect<raw_message> raw_message::from_multipart(const span<const frame> frames)
  {
    if (frames.size() != 3)
      return failure::multipart_length(frames.size());
    return from_parts(frames[0], frames[1], frames[2]);
  }

  expect<raw_message> raw_message::from_parts(const frame topic_frame, const frame data, const frame sequence)
  {
    const expect<topic> kind = topic_from_bytes(topic_frame);
    if (!kind)
      return kind.error();

    if (sequence.size() != sequence_length)
      return failure::sequence_length(sequence.size());

    const std::uint32_t value =
      std::uint32_t(sequence[0]) |
      (std::uint32_t(sequence[1]) << 8) |
      (std::uint32_t(sequence[2]) << 16) |
      (std::uint32_t(sequence[3]) << 24);
    return raw_message{*kind, data, value};
  }

  std::array<std::uint8_t, sequence_length> raw_message::sequence_bytes() const noexcept
  {
    return {{
      std::uint8_t(sequence_),
      std::uint8_t(sequence_ >> 8),
      std::uint8_t(sequence_ >> 16),
      std::uint8_t(sequence_ >> 24)
    }};
  }

  zmq::multipart raw_message::to_multipart() const
  {
    const span<const std::uint8_t> name = as_bytes(kind_);
    const auto sequence = sequence_bytes();

    zmq::multipart out{};
    out.emplace_back(name.begin(), name.end());
    out.emplace_back(data_.begin(), data_.end());
    out.emplace_back(sequence.begin(), sequence.end());
    return out;
  }

  message_content::message_content(const topic kind)
    : hash_{},
      block_{},
      tx_{},
      sequence_(sequence_message::block_connect(bitcoin::hash256{})),
      kind_(kind)
  {}

  void message_content::check(const topic expected) const
  {
    if (kind_ != expected)
    {
      throw std::logic_error{
        std::string{"message content is "} + get_string(kind_) + ", not " + get_string(expected)
      };
    }
  }

  message_content message_content::from_block_hash(const bitcoin::hash256& blockhash)
  {
    message_content out{topic::hash_block};
    out.hash_ = blockhash;
    return out;
  }

  message_content message_content::from_txid(const bitcoin::hash256& txid)
  {
    message_content out{topic::hash_tx};
    out.hash_ = txid;
    return out;
  }

  message_content message_content::from_block(bitcoin::block value)
  {
    message_content out{topic::raw_block};
    out.block_ = std::move(value);
    return out;
  }

  message_content message_content::from_tx(bitcoin::transaction value)
  {
    message_content out{topic::raw_tx};
    out.tx_ = std::move(value);
    return out;
  }

  message_content message_content::from_sequence(const sequence_message& value)
  {
    message_content out{topic::sequence};
    out.sequence_ = value;
    return out;
  }

  expect<message_content> message_content::from_raw(const raw_message& src)
  {
    switch (src.kind())
    {
    case topic::hash_block:
    {
      const auto hash = hash_from_frame(src.data());
      if (!hash)
        return hash.error();
      return from_block_hash(*hash);
    }
    case topic::hash_tx:
    {
      const auto hash = hash_from_frame(src.data());
      if (!hash)
        return hash.error();
      return from_txid(*hash);
    }
    case topic::raw_block:
    {
      auto value = bitcoin::block_from_bytes(src.data());
      if (!value)
        return value.error();
      return from_block(std::move(*value));
    }
    case topic::raw_tx:
    {
      auto value = bitcoin::transaction_from_bytes(src.data());
      if (!value)
        return value.error();
      return from_tx(std::move(*value));
    }
    case topic::sequence:
    {
      const auto value = sequence_message::from_bytes(src.data());
      if (!value)
        return value.error();
      return from_sequence(*value);
    }
    default:
      break;
    }
    return failure::unknown_topic(as_bytes(src.kind()));
  }

  const bitcoin::hash256& message_content::block_hash() const
  {
    check(topic::hash_block);
    return hash_;
  }

  const bitcoin::hash256& message_content::txid() const
  {
    check(topic::hash_tx);
    return hash_;
  }

  const bitcoin::block& message_content::block() const
  {
    check(topic::raw_block);
    return block_;
  }

  const bitcoin::transaction& message_content::tx() const
  {
    check(topic::raw_tx);
    return tx_;
  }

  const sequence_message& message_content::sequence() const
  {
    check(topic::sequence);
    return sequence_;
  }

  std::vector<std::uint8_t> message_content::serialize_data() const
  {
    switch (kind_)
    {
    case topic::hash_block:
    case topic::hash_tx:
      return hash_to_frame(hash_);
    case topic::raw_block:
      return bitcoin::to_bytes(block_);
    case topic::raw_tx:
      return bitcoin::to_bytes(tx_);
    case topic::sequence:
      return sequence_.to_bytes();
    default:
      break;
    }
    return {};
  }

  bool operator==(const message_content& lhs, const message_content& rhs)
  {
    if (lhs.kind() != rhs.kind())
      return false;

    switch (lhs.kind())
    {
    case topic::hash_block:
      return lhs.block_hash() == rhs.block_hash();
    case topic::hash_tx:
      return lhs.txid() == rhs.txid();
    case topic::raw_block:
      return lhs.block() == rhs.block();
    case topic::raw_tx:
      return lhs.tx() == rhs.tx();
    case topic::sequence:
      return lhs.sequence() == rhs.sequence();
    default:
      break;
    }
    return false;
  }

  zmq::multipart message::to_multipart() const
  {
    const std::vector<std::uint8_t> data = content.serialize_data();
    return raw_message{kind(), to_span(data), sequence}.to_multipart();
  }

  expect<message> decode(const raw_message& src)
  {
    auto content = message_content::from_raw(src);
    if (!content)
      return content.error();
    return message{std::move(*content), src.sequence()};
  }

  expect<message> decode_multipart(const span<const frame> frames)
  {
    const auto raw = raw_message::from_multipart(frames);
    if (!raw)
      return raw.error();
    return decode(*raw);
  }

  expect<message> decode_multipart(const zmq::multipart& frames)
  {
    const std::vector<frame> views = to_frames(frames);
    return decode_multipart(to_span(views));
  }

  std::string to_string(const message& src)
  {
    std::string out{};
    switch (src.kind())
    {
    case topic::hash_block:
      out = "HashBlock(" + bitcoin::to_string(src.content.block_hash());
      break;
    case topic::hash_tx:
      out = "HashTx(" + bitcoin::to_string(src.content.txid());
      break;
    case topic::raw_block:
      out = "Block(" + bitcoin::to_string(src.content.block().hash());
      break;
    case topic::raw_tx:
      out = "Tx(" + bitcoin::to_string(src.content.tx().hash());
      break;
    case topic::sequence:
      out = "Sequence(" + to_string(src.content.sequence());
      break;
    default:
      out = "Unknown(";
      break;
    }
    out.append(", sequence=");
    out.append(std::to_string(src.sequence));
    out.push_back(')');
    return out;
  }
}
