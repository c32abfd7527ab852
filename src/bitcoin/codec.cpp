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

#include "bitcoin/codec.hpp"

#include <algorithm>
#include <utility>

namespace btczmq
{
namespace bitcoin
{
  namespace
  {
    constexpr const bool wire = true;
    constexpr const bool witness = true;

    libbitcoin::system::data_chunk to_chunk(const span<const std::uint8_t> source)
    {
      return libbitcoin::system::data_chunk(source.begin(), source.end());
    }
  }

  std::string to_string(const hash256& src)
  {
    return libbitcoin::system::encode_hash(src);
  }

  expect<hash256> hash256_from_bytes(const span<const std::uint8_t> src)
  {
    hash256 out{};
    if (src.size() != out.size())
      return failure::hash_length(src.size());

    std::copy(src.begin(), src.end(), out.begin());
    return out;
  }

  expect<hash256> hash256_from_hex(const std::string& src)
  {
    hash256 out{};
    if (!libbitcoin::system::decode_hash(out, src))
      return {std::make_error_code(std::errc::invalid_argument)};
    return out;
  }

  expect<transaction> transaction_from_bytes(const span<const std::uint8_t> source)
  {
    transaction out{};
    if (!out.from_data(to_chunk(source), wire, witness))
      return {error::deserialization::invalid_transaction};
    if (out.serialized_size(wire, witness) != source.size())
      return {error::deserialization::trailing_data};
    return {std::move(out)};
  }

  expect<block> block_from_bytes(const span<const std::uint8_t> source)
  {
    block out{};
    if (!out.from_data(to_chunk(source), witness))
      return {error::deserialization::invalid_block};
    if (out.serialized_size(witness) != source.size())
      return {error::deserialization::trailing_data};
    return {std::move(out)};
  }

  std::vector<std::uint8_t> to_bytes(const transaction& src)
  {
    return src.to_data(wire, witness);
  }

  std::vector<std::uint8_t> to_bytes(const block& src)
  {
    return src.to_data(witness);
  }
} // bitcoin
} // btczmq
