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

#include <chrono>
#include <thread>
#include <utility>

#include "async/context.hpp"
#include "channel.hpp"

using namespace btczmq;

TEST(Channel, Fifo)
{
  auto ends = channel::make<int>();
  EXPECT_TRUE(ends.first.push(1));
  EXPECT_TRUE(ends.first.push(2));

  EXPECT_EQ(1, ends.second.recv().value());
  EXPECT_EQ(2, ends.second.try_recv().value());

  const expect<int> empty = ends.second.try_recv();
  ASSERT_FALSE(empty.has_value());
  EXPECT_TRUE(async::is_pending(empty));
}

TEST(Channel, PushFailsAfterReceiverDropped)
{
  auto ends = channel::make<int>();
  EXPECT_TRUE(ends.first.push(1));
  {
    const channel::receiver<int> dropped{std::move(ends.second)};
  }
  EXPECT_FALSE(ends.first.push(2));
  EXPECT_FALSE(ends.first.push(3));
}

TEST(Channel, DrainsThenTerminates)
{
  auto ends = channel::make<int>();
  EXPECT_TRUE(ends.first.push(5));
  {
    const channel::sender<int> dropped{std::move(ends.first)};
  }

  EXPECT_EQ(5, ends.second.recv().value());
  const expect<int> last = ends.second.recv();
  ASSERT_FALSE(last.has_value());
  EXPECT_EQ(last.error(), error::codec::terminated);
}

TEST(Channel, RecvWakesOnPush)
{
  auto ends = channel::make<int>();
  channel::sender<int> source{std::move(ends.first)};
  bool pushed = false;
  std::thread producer{[&source, &pushed] ()
  {
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    pushed = source.push(9);
  }};

  const expect<int> value = ends.second.recv_for(std::chrono::seconds{10});
  producer.join();
  EXPECT_TRUE(pushed);
  ASSERT_TRUE(value.has_value()) << value.error().message();
  EXPECT_EQ(9, *value);
}

TEST(Channel, RecvForTimesOut)
{
  auto ends = channel::make<int>();
  const expect<int> value = ends.second.recv_for(std::chrono::milliseconds{20});
  ASSERT_FALSE(value.has_value());
  EXPECT_EQ(value.error(), error::codec::timeout);
}
