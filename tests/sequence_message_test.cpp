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

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "common.hpp"
#include "sequence_message.hpp"

using namespace btczmq;

namespace
{
  constexpr const char hash_hex[] =
    "00000000000000000007a8b1b6a5e0e5cc0e6f77f4f4a7e1fa0c4c1d4a6e3b21";

  std::vector<std::uint8_t> record(const char label, const std::vector<std::uint8_t>& suffix = {})
  {
    std::vector<std::uint8_t> out = test::from_hex(hash_hex);
    out.push_back(std::uint8_t(label));
    out.insert(out.end(), suffix.begin(), suffix.end());
    return out;
  }
}

TEST(SequenceMessage, BlockConnect)
{
  const std::vector<std::uint8_t> bytes = record('C');
  const expect<sequence_message> parsed = sequence_message::from_bytes(to_span(bytes));
  ASSERT_TRUE(parsed.has_value()) << parsed.error().message();

  EXPECT_EQ(sequence_message::label::block_connect, parsed->kind());
  EXPECT_TRUE(parsed->is_block());
  EXPECT_FALSE(parsed->is_mempool());
  EXPECT_EQ(hash_hex, bitcoin::to_string(parsed->blockhash()));
  EXPECT_EQ(33u, parsed->raw_length());
  EXPECT_EQ(bytes, parsed->to_bytes());
  EXPECT_EQ("BlockConnect(" + std::string{hash_hex} + ")", to_string(*parsed));
}

TEST(SequenceMessage, BlockDisconnect)
{
  const std::vector<std::uint8_t> bytes = record('D');
  const expect<sequence_message> parsed = sequence_message::from_bytes(to_span(bytes));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(sequence_message::label::block_disconnect, parsed->kind());
  EXPECT_EQ(sequence_message::block_disconnect(parsed->blockhash()), *parsed);
}

TEST(SequenceMessage, MempoolAcceptanceLittleEndianSequence)
{
  const std::vector<std::uint8_t> bytes = record('A', {1, 0, 0, 0, 0, 0, 0, 0});
  const expect<sequence_message> parsed = sequence_message::from_bytes(to_span(bytes));
  ASSERT_TRUE(parsed.has_value()) << parsed.error().message();

  EXPECT_EQ(sequence_message::label::mempool_acceptance, parsed->kind());
  EXPECT_TRUE(parsed->is_mempool());
  EXPECT_EQ(1u, parsed->mempool_sequence());
  EXPECT_EQ(hash_hex, bitcoin::to_string(parsed->txid()));
  EXPECT_EQ(41u, parsed->raw_length());
  EXPECT_EQ(bytes, parsed->to_bytes());
  EXPECT_EQ(
    "MempoolAcceptance(" + std::string{hash_hex} + ", mempool_sequence=1)", to_string(*parsed)
  );
}

TEST(SequenceMessage, MempoolRemovalLargeSequence)
{
  const std::vector<std::uint8_t> bytes = record('R', {0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01});
  const expect<sequence_message> parsed = sequence_message::from_bytes(to_span(bytes));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(sequence_message::label::mempool_removal, parsed->kind());
  EXPECT_EQ(0x0102030405060708u, parsed->mempool_sequence());
  EXPECT_EQ(bytes, parsed->to_bytes());
}

TEST(SequenceMessage, TooShort)
{
  const std::vector<std::uint8_t> bytes(32, 0);
  const expect<sequence_message> parsed = sequence_message::from_bytes(to_span(bytes));
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error(), error::codec::invalid_sequence_message_length);
  EXPECT_EQ(32u, parsed.error().length());
}

TEST(SequenceMessage, WrongLengthForLabel)
{
  {
    const std::vector<std::uint8_t> bytes = record('C', {0});
    const expect<sequence_message> parsed = sequence_message::from_bytes(to_span(bytes));
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error(), error::codec::invalid_sequence_message_length);
    EXPECT_EQ(34u, parsed.error().length());
  }
  {
    const std::vector<std::uint8_t> bytes = record('A');
    const expect<sequence_message> parsed = sequence_message::from_bytes(to_span(bytes));
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error(), error::codec::invalid_sequence_message_length);
    EXPECT_EQ(33u, parsed.error().length());
  }
}

TEST(SequenceMessage, UnknownLabel)
{
  const std::vector<std::uint8_t> bytes = record('X');
  const expect<sequence_message> parsed = sequence_message::from_bytes(to_span(bytes));
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error(), error::codec::invalid_sequence_message_label);
  EXPECT_EQ(std::uint32_t('X'), parsed.error().value());
}

TEST(SequenceMessage, AccessorsCheckKind)
{
  const bitcoin::hash256 hash = bitcoin::hash256_from_hex(hash_hex).value();
  const sequence_message block = sequence_message::block_connect(hash);
  const sequence_message mempool = sequence_message::mempool_removal(hash, 7);

  EXPECT_THROW(block.txid(), std::logic_error);
  EXPECT_THROW(block.mempool_sequence(), std::logic_error);
  EXPECT_THROW(mempool.blockhash(), std::logic_error);
  EXPECT_EQ(hash, block.hash());
  EXPECT_EQ(hash, mempool.hash());
  EXPECT_NE(block, mempool);
  EXPECT_NE(mempool, sequence_message::mempool_removal(hash, 8));
}
