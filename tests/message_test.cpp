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

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "common.hpp"
#include "message.hpp"

using namespace btczmq;

TEST(Message, RawTx)
{
  const zmq::multipart parts{test::bytes("rawtx"), test::genesis_tx_bytes(), {3, 0, 0, 0}};
  const expect<message> decoded = decode_multipart(parts);
  ASSERT_TRUE(decoded.has_value()) << decoded.error().message();

  EXPECT_EQ(topic::raw_tx, decoded->kind());
  EXPECT_EQ(3u, decoded->sequence);
  EXPECT_EQ(test::genesis_txid, bitcoin::to_string(decoded->content.tx().hash()));
  EXPECT_EQ(parts, decoded->to_multipart());
  EXPECT_EQ("Tx(" + std::string{test::genesis_txid} + ", sequence=3)", to_string(*decoded));
  EXPECT_THROW(decoded->content.block(), std::logic_error);
}

TEST(Message, RawBlock)
{
  const zmq::multipart parts{test::bytes("rawblock"), test::genesis_block_bytes(), {0, 1, 0, 0}};
  const expect<message> decoded = decode_multipart(parts);
  ASSERT_TRUE(decoded.has_value()) << decoded.error().message();

  EXPECT_EQ(topic::raw_block, decoded->kind());
  EXPECT_EQ(256u, decoded->sequence);
  EXPECT_EQ(test::genesis_block_hash, bitcoin::to_string(decoded->content.block().hash()));
  EXPECT_EQ(parts, decoded->to_multipart());
  EXPECT_EQ("Block(" + std::string{test::genesis_block_hash} + ", sequence=256)", to_string(*decoded));
}

TEST(Message, HashTxIsDisplayOrder)
{
  std::vector<std::uint8_t> hash = test::from_hex(test::genesis_txid);
  const zmq::multipart parts{test::bytes("hashtx"), hash, {4, 0, 0, 0}};
  const expect<message> decoded = decode_multipart(parts);
  ASSERT_TRUE(decoded.has_value()) << decoded.error().message();

  EXPECT_EQ(topic::hash_tx, decoded->kind());
  EXPECT_EQ(4u, decoded->sequence);
  EXPECT_EQ(test::genesis_txid, bitcoin::to_string(decoded->content.txid()));

  std::reverse(hash.begin(), hash.end());
  EXPECT_TRUE(std::equal(hash.begin(), hash.end(), decoded->content.txid().begin()));
  EXPECT_EQ(parts, decoded->to_multipart());
  EXPECT_EQ("HashTx(" + std::string{test::genesis_txid} + ", sequence=4)", to_string(*decoded));
}

TEST(Message, Sequence)
{
  std::vector<std::uint8_t> data = test::from_hex(test::genesis_block_hash);
  data.push_back('C');
  const zmq::multipart parts{test::bytes("sequence"), data, {0xff, 0xff, 0xff, 0xff}};
  const expect<message> decoded = decode_multipart(parts);
  ASSERT_TRUE(decoded.has_value()) << decoded.error().message();

  EXPECT_EQ(0xffffffffu, decoded->sequence);
  EXPECT_EQ(sequence_message::label::block_connect, decoded->content.sequence().kind());
  EXPECT_EQ(
    "Sequence(BlockConnect(" + std::string{test::genesis_block_hash} + "), sequence=4294967295)",
    to_string(*decoded)
  );
}

TEST(Message, FrameCount)
{
  for (const std::size_t count : {0u, 1u, 2u, 4u})
  {
    const zmq::multipart parts(count, test::bytes("hashtx"));
    const expect<message> decoded = decode_multipart(parts);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), error::codec::invalid_multipart_length);
    EXPECT_EQ(count, decoded.error().length());
  }
}

TEST(Message, UnknownTopic)
{
  const zmq::multipart parts{std::vector<std::uint8_t>(100, 'z'), {}, {0, 0, 0, 0}};
  const expect<message> decoded = decode_multipart(parts);
  ASSERT_FALSE(decoded.has_value());
  EXPECT_EQ(decoded.error(), error::codec::unknown_topic);
  EXPECT_EQ(100u, decoded.error().length());
  EXPECT_EQ(topic_capture_length, decoded.error().topic().size());
}

TEST(Message, CheckOrder)
{
  {
    const zmq::multipart parts{test::bytes("hashtx"), std::vector<std::uint8_t>(31, 0), {0, 0, 0}};
    const expect<message> decoded = decode_multipart(parts);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), error::codec::invalid_sequence_length);
    EXPECT_EQ(3u, decoded.error().length());
  }
  {
    const zmq::multipart parts{test::bytes("hashtx"), std::vector<std::uint8_t>(31, 0), {0, 0, 0, 0}};
    const expect<message> decoded = decode_multipart(parts);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), error::codec::invalid_256bit_hash_length);
    EXPECT_EQ(31u, decoded.error().length());
  }
}

TEST(Message, MalformedConsensusData)
{
  std::vector<std::uint8_t> tx = test::genesis_tx_bytes();
  tx.push_back(0);
  const zmq::multipart parts{test::bytes("rawtx"), tx, {0, 0, 0, 0}};
  const expect<message> decoded = decode_multipart(parts);
  ASSERT_FALSE(decoded.has_value());
  EXPECT_TRUE(decoded.error().is_bitcoin_deserialization());
  EXPECT_EQ(decoded.error(), bitcoin::error::deserialization::trailing_data);

  tx.resize(10);
  const zmq::multipart truncated{test::bytes("rawblock"), tx, {0, 0, 0, 0}};
  const expect<message> block = decode_multipart(truncated);
  ASSERT_FALSE(block.has_value());
  EXPECT_EQ(block.error(), bitcoin::error::deserialization::invalid_block);
}

TEST(Message, ContentEquality)
{
  const bitcoin::hash256 hash = bitcoin::hash256_from_hex(test::genesis_block_hash).value();
  const message block{message_content::from_block_hash(hash), 1};
  const message tx{message_content::from_txid(hash), 1};

  EXPECT_EQ(block, (message{message_content::from_block_hash(hash), 1}));
  EXPECT_NE(block, tx);
  EXPECT_NE(block, (message{message_content::from_block_hash(hash), 2}));
  EXPECT_THROW(tx.content.block_hash(), std::logic_error);
  EXPECT_EQ(hash, tx.content.txid());
}
