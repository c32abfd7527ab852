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

#include <string>

#include "topic.hpp"

using namespace btczmq;

TEST(Topic, ParsesEveryKnownTopic)
{
  const topic all[] = {
    topic::hash_block, topic::hash_tx, topic::raw_block, topic::raw_tx, topic::sequence
  };
  for (const topic value : all)
  {
    const expect<topic> parsed = topic_from_bytes(as_bytes(value));
    ASSERT_TRUE(parsed.has_value()) << get_string(value);
    EXPECT_EQ(value, *parsed);
  }
}

TEST(Topic, WireStrings)
{
  EXPECT_STREQ("hashblock", get_string(topic::hash_block));
  EXPECT_STREQ("hashtx", get_string(topic::hash_tx));
  EXPECT_STREQ("rawblock", get_string(topic::raw_block));
  EXPECT_STREQ("rawtx", get_string(topic::raw_tx));
  EXPECT_STREQ("sequence", get_string(topic::sequence));
  EXPECT_EQ(9u, as_bytes(topic::hash_block).size());
  EXPECT_EQ(topic_max_length, as_bytes(topic::hash_block).size());
}

TEST(Topic, RejectsPrefixAndSuffix)
{
  for (const char* text : {"hash", "rawtxx", "hashblock2", "", "HASHTX", " rawtx"})
  {
    const expect<topic> parsed = topic_from_bytes(strspan(text));
    ASSERT_FALSE(parsed.has_value()) << text;
    EXPECT_EQ(parsed.error(), error::codec::unknown_topic);
    EXPECT_TRUE(equal(strspan(text), parsed.error().topic()));
  }
}

TEST(Topic, UnknownTopicKeepsLengthAndCapturedBytes)
{
  const std::string long_topic(100, 'x');
  const expect<topic> parsed = topic_from_bytes(to_byte_span(long_topic));
  ASSERT_FALSE(parsed.has_value());
  EXPECT_EQ(parsed.error(), error::codec::unknown_topic);
  EXPECT_EQ(100u, parsed.error().length());
  EXPECT_EQ(topic_capture_length, parsed.error().topic().size());
}
