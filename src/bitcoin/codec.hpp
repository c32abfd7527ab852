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

#ifndef BTCZMQ_BITCOIN_CODEC_HPP
#define BTCZMQ_BITCOIN_CODEC_HPP

#include <bitcoin/system.hpp>
#include <cstdint>
#include <string>
#include <vector>

#include "bitcoin/error.hpp"
#include "expect.hpp"
#include "span.hpp"

namespace btczmq
{
namespace bitcoin
{
  //! 256-bit hash in internal (little-endian) byte order.
  using hash256 = libbitcoin::system::hash_digest;
  using block = libbitcoin::system::chain::block;
  using transaction = libbitcoin::system::chain::transaction;

  //! \return Hex in display order (byte-reversed), as printed by `bitcoind`.
  std::string to_string(const hash256& src);

  //! \return Hash from exactly 32 bytes in internal order, else `invalid_256bit_hash_length`.
  expect<hash256> hash256_from_bytes(span<const std::uint8_t> src);

  //! \return Hash from 64 hex digits in display order.
  expect<hash256> hash256_from_hex(const std::string& src);

  /*! \return Segwit aware decode of all of `source`, else
      `invalid_transaction` or `trailing_data`. */
  expect<transaction> transaction_from_bytes(span<const std::uint8_t> source);

  //! \return Block decoded from all of `source`, else `invalid_block` or `trailing_data`.
  expect<block> block_from_bytes(span<const std::uint8_t> source);

  //! \return Consensus encoding of `src` including witness data.
  std::vector<std::uint8_t> to_bytes(const transaction& src);

  //! \return Consensus encoding of `src` including witness data.
  std::vector<std::uint8_t> to_bytes(const block& src);
} // bitcoin
} // btczmq

#endif // BTCZMQ_BITCOIN_CODEC_HPP
