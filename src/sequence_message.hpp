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

#ifndef BTCZMQ_SEQUENCE_MESSAGE_HPP
#define BTCZMQ_SEQUENCE_MESSAGE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "bitcoin/codec.hpp"
#include "expect.hpp"
#include "span.hpp"

namespace btczmq
{
  /*! Record published on the `sequence` topic. Hashes are stored in
      internal byte order. Transactions removed from the mempool because
      they were included in a block do not produce a `mempool_removal`,
      but still advance the mempool sequence. */
  class sequence_message
  {
  public:
    //! Label byte of each record type.
    enum class label : std::uint8_t
    {
      block_connect = 'C',
      block_disconnect = 'D',
      mempool_acceptance = 'A',
      mempool_removal = 'R'
    };

    static constexpr const std::size_t hash_length = 32;
    static constexpr const std::size_t block_length = hash_length + 1;
    static constexpr const std::size_t mempool_length = block_length + 8;

  private:
    bitcoin::hash256 hash_;
    std::uint64_t mempool_sequence_;
    label label_;

    sequence_message(label kind, const bitcoin::hash256& hash, std::uint64_t mempool_sequence) noexcept
      : hash_(hash), mempool_sequence_(mempool_sequence), label_(kind)
    {}

    void check_block() const;
    void check_mempool() const;

  public:
    static sequence_message block_connect(const bitcoin::hash256& blockhash) noexcept
    {
      return {label::block_connect, blockhash, 0};
    }
    static sequence_message block_disconnect(const bitcoin::hash256& blockhash) noexcept
    {
      return {label::block_disconnect, blockhash, 0};
    }
    static sequence_message mempool_acceptance(const bitcoin::hash256& txid, std::uint64_t mempool_sequence) noexcept
    {
      return {label::mempool_acceptance, txid, mempool_sequence};
    }
    static sequence_message mempool_removal(const bitcoin::hash256& txid, std::uint64_t mempool_sequence) noexcept
    {
      return {label::mempool_removal, txid, mempool_sequence};
    }

    /*! Decode a record: 32 byte hash in display order, a label, and a
        little-endian mempool sequence for `A` and `R` records. */
    static expect<sequence_message> from_bytes(span<const std::uint8_t> source);

    label kind() const noexcept { return label_; }
    bool is_block() const noexcept
    {
      return label_ == label::block_connect || label_ == label::block_disconnect;
    }
    bool is_mempool() const noexcept { return !is_block(); }

    //! \return Block hash. \throw std::logic_error if `!is_block()`.
    const bitcoin::hash256& blockhash() const;

    //! \return Transaction id. \throw std::logic_error if `!is_mempool()`.
    const bitcoin::hash256& txid() const;

    //! \return Mempool sequence. \throw std::logic_error if `!is_mempool()`.
    std::uint64_t mempool_sequence() const;

    //! \return Block hash or txid, whichever the record carries.
    const bitcoin::hash256& hash() const noexcept { return hash_; }

    //! \return Size of `to_bytes()`, 33 or 41.
    std::size_t raw_length() const noexcept
    {
      if (is_block())
        return block_length;
      return mempool_length;
    }

    //! \return Wire encoding, inverse of `from_bytes`.
    std::vector<std::uint8_t> to_bytes() const;
  };

  bool operator==(const sequence_message& lhs, const sequence_message& rhs) noexcept;
  inline bool operator!=(const sequence_message& lhs, const sequence_message& rhs) noexcept
  {
    return !(lhs == rhs);
  }

  //! \return Static name of `value`, such as `BlockConnect`.
  const char* get_string(sequence_message::label value) noexcept;

  //! \return `BlockConnect(<hash>)` or `MempoolAcceptance(<txid>, mempool_sequence=N)` form.
  std::string to_string(const sequence_message& src);
}

#endif // BTCZMQ_SEQUENCE_MESSAGE_HPP
