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

#ifndef BTCZMQ_MESSAGE_HPP
#define BTCZMQ_MESSAGE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "bitcoin/codec.hpp"
#include "expect.hpp"
#include "sequence_message.hpp"
#include "span.hpp"
#include "topic.hpp"
#include "zmq.hpp"

namespace btczmq
{
  //! View of one frame of a multipart message.
  using frame = span<const std::uint8_t>;

  //! Length of the sequence number frame.
  constexpr const std::size_t sequence_length = 4;

  //! Largest data frame accepted by the framing loop (maximum block weight).
  constexpr const std::size_t data_max_length = 4000000;

  //! \return Views of every frame in `src`.
  std::vector<frame> to_frames(const zmq::multipart& src);

  //! A message with a known topic and undecoded data. Does not own `data()`.
  class raw_message
  {
    frame data_;
    std::uint32_t sequence_;
    topic kind_;

  public:
    raw_message(const topic kind, const frame data, const std::uint32_t sequence) noexcept
      : data_(data), sequence_(sequence), kind_(kind)
    {}

    /*! \return Message from exactly three frames, else
        `invalid_multipart_length` with the frame count. */
    static expect<raw_message> from_multipart(span<const frame> frames);

    //! \return Message after checking the topic and then the sequence length.
    static expect<raw_message> from_parts(frame topic_frame, frame data, frame sequence);

    topic kind() const noexcept { return kind_; }
    frame data() const noexcept { return data_; }
    std::uint32_t sequence() const noexcept { return sequence_; }

    //! \return Little-endian encoding of `sequence()`.
    std::array<std::uint8_t, sequence_length> sequence_bytes() const noexcept;

    //! \return Owned copies of the topic, data, and sequence frames.
    zmq::multipart to_multipart() const;
  };

  //! Decoded data of a message. Only the field matching `kind()` is valid.
  class message_content
  {
    bitcoin::hash256 hash_;
    bitcoin::block block_;
    bitcoin::transaction tx_;
    sequence_message sequence_;
    topic kind_;

    explicit message_content(topic kind);

    void check(topic expected) const;

  public:
    //! Default is an all-zero `hash_block`.
    message_content()
      : message_content(topic::hash_block)
    {}

    static message_content from_block_hash(const bitcoin::hash256& blockhash);
    static message_content from_txid(const bitcoin::hash256& txid);
    static message_content from_block(bitcoin::block value);
    static message_content from_tx(bitcoin::transaction value);
    static message_content from_sequence(const sequence_message& value);

    //! \return Content decoded from `src.data()` according to `src.kind()`.
    static expect<message_content> from_raw(const raw_message& src);

    topic kind() const noexcept { return kind_; }

    //! \throw std::logic_error if `kind() != topic::hash_block`.
    const bitcoin::hash256& block_hash() const;
    //! \throw std::logic_error if `kind() != topic::hash_tx`.
    const bitcoin::hash256& txid() const;
    //! \throw std::logic_error if `kind() != topic::raw_block`.
    const bitcoin::block& block() const;
    //! \throw std::logic_error if `kind() != topic::raw_tx`.
    const bitcoin::transaction& tx() const;
    //! \throw std::logic_error if `kind() != topic::sequence`.
    const sequence_message& sequence() const;

    //! \return Wire encoding of the data frame.
    std::vector<std::uint8_t> serialize_data() const;
  };

  bool operator==(const message_content& lhs, const message_content& rhs);
  inline bool operator!=(const message_content& lhs, const message_content& rhs)
  {
    return !(lhs == rhs);
  }

  //! A decoded message and the per-topic sequence number of the publisher.
  struct message
  {
    message_content content;
    std::uint32_t sequence;

    topic kind() const noexcept { return content.kind(); }

    //! \return Topic, data, and sequence frames.
    zmq::multipart to_multipart() const;
  };

  inline bool operator==(const message& lhs, const message& rhs)
  {
    return lhs.sequence == rhs.sequence && lhs.content == rhs.content;
  }
  inline bool operator!=(const message& lhs, const message& rhs)
  {
    return !(lhs == rhs);
  }

  //! \return Message decoded from `src`.
  expect<message> decode(const raw_message& src);

  //! \return Message decoded from exactly three frames.
  expect<message> decode_multipart(span<const frame> frames);
  expect<message> decode_multipart(const zmq::multipart& frames);

  //! \return `HashBlock(<hash>, sequence=N)` form.
  std::string to_string(const message& src);
}

#endif // BTCZMQ_MESSAGE_HPP
