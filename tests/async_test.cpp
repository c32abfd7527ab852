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
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "async/context.hpp"
#include "async/stream.hpp"
#include "async/timeout.hpp"
#include "common.hpp"

using namespace btczmq;

namespace
{
  //! Replace the socket of `pub` with a new PUB socket bound to `endpoint`.
  void rebind(test::publisher& pub, const std::string& endpoint)
  {
    pub.socket = BTCZMQ_UNWRAP(zmq::make_socket(pub.ctx.get(), ZMQ_PUB));
    pub.endpoint = endpoint;
    for (unsigned attempt = 0; zmq_bind(pub.socket.get(), endpoint.c_str()) != 0; ++attempt)
    {
      if (attempt == 500)
        BTCZMQ_ZMQ_THROW("zmq_bind failed");
      std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
  }

  //! eturn True once `wait` has `target` pending handshakes, false if it resolved or 10s passed.
  bool poll_until_pending(async::handshake_wait& wait, const std::size_t target)
  {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{10};
    while (wait.pending_handshakes() != target)
    {
      if (deadline <= std::chrono::steady_clock::now())
        return false;

      async::context cx{async::waker{}};
      const expect<async::monitor_stream> stream = wait.poll(cx);
      if (!async::is_pending(stream))
        return false;
      std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
    return true;
  }
}

TEST(HandshakeWait, NoEndpointsResolvesImmediately)
{
  async::handshake_wait wait = async::subscribe_async_wait_handshake({});
  async::context cx{async::waker{}};

  expect<async::monitor_stream> stream = wait.poll(cx);
  ASSERT_TRUE(stream.has_value()) << stream.error().message();
  EXPECT_TRUE(cx.sockets().empty());
  EXPECT_THROW(wait.poll(cx), std::logic_error);
}

TEST(HandshakeWait, SetupFailureResolvesImmediately)
{
  async::handshake_wait wait = async::subscribe_async_wait_handshake({"not-an-endpoint"});
  async::context cx{async::waker{}};

  const expect<async::monitor_stream> stream = wait.poll(cx);
  ASSERT_FALSE(stream.has_value());
  EXPECT_TRUE(stream.error().is_transport());
}

TEST(HandshakeWait, WaitsForEveryPublisher)
{
  const test::publisher first{};
  const test::publisher second{};

  async::handshake_wait wait =
    async::subscribe_async_wait_handshake({first.endpoint, second.endpoint});
  EXPECT_EQ(2u, wait.pending_handshakes());

  expect<async::monitor_stream> stream = async::block_on(wait);
  ASSERT_TRUE(stream.has_value()) << stream.error().message();
  EXPECT_EQ(0u, wait.pending_handshakes());
  EXPECT_TRUE(stream->monitor_socket() != nullptr);
}

TEST(HandshakeWait, DisconnectNeedsAnotherHandshake)
{
  std::string reserved{};
  {
    const test::publisher unused{};
    reserved = unused.endpoint;
  }

  test::publisher first{};
  async::handshake_wait wait = async::subscribe_async_wait_handshake({first.endpoint, reserved});
  EXPECT_EQ(2u, wait.pending_handshakes());
  ASSERT_TRUE(poll_until_pending(wait, 1));

  first.socket.reset();
  ASSERT_TRUE(poll_until_pending(wait, 2));

  rebind(first, first.endpoint);
  ASSERT_TRUE(poll_until_pending(wait, 1));

  for (unsigned i = 0; i < 20; ++i)
  {
    async::context cx{async::waker{}};
    const expect<async::monitor_stream> stream = wait.poll(cx);
    ASSERT_TRUE(async::is_pending(stream));
    std::this_thread::sleep_for(std::chrono::milliseconds{5});
  }
  EXPECT_EQ(1u, wait.pending_handshakes());

  test::publisher second{};
  rebind(second, reserved);

  expect<async::monitor_stream> stream = async::block_on(wait);
  ASSERT_TRUE(stream.has_value()) << stream.error().message();
  EXPECT_EQ(0u, wait.pending_handshakes());
}

TEST(HandshakeWait, Timeout)
{
  auto wait = async::subscribe_async_wait_handshake_timeout(
    {"tcp://127.0.0.1:1"}, std::chrono::milliseconds{200}
  );

  const auto start = std::chrono::steady_clock::now();
  const expect<async::monitor_stream> stream = async::block_on(wait);
  ASSERT_FALSE(stream.has_value());
  EXPECT_EQ(stream.error(), error::codec::timeout);
  EXPECT_LE(std::chrono::milliseconds{200}, std::chrono::steady_clock::now() - start);
  EXPECT_EQ(1u, wait.get().pending_handshakes());
}

TEST(MonitorStream, ReportsEventsAndMessages)
{
  const test::repeater source{test::hash_block};
  expect<async::monitor_stream> stream = async::subscribe_async_monitor({source.endpoint()});
  ASSERT_TRUE(stream.has_value()) << stream.error().message();

  for (;;)
  {
    const expect<async::socket_message> next = async::block_on_next(*stream);
    ASSERT_TRUE(next.has_value()) << next.error().message();
    if (next->is_event())
    {
      EXPECT_EQ(source.endpoint(), next->event().source_url);
      EXPECT_THROW(next->get_message(), std::logic_error);
      continue;
    }

    EXPECT_EQ(topic::hash_block, next->get_message().kind());
    EXPECT_EQ(0u, async::to_string(*next).find("Message(HashBlock("));
    break;
  }
}

TEST(CheckedStream, DisconnectThenTerminated)
{
  test::publisher source{};
  auto wait = async::subscribe_async_wait_handshake_timeout(
    {source.endpoint}, std::chrono::seconds{10}
  );
  expect<async::monitor_stream> connected = async::block_on(wait);
  ASSERT_TRUE(connected.has_value()) << connected.error().message();

  async::checked_stream stream{std::move(*connected)};
  source.socket.reset();

  const expect<message> lost = async::block_on_next(stream);
  ASSERT_FALSE(lost.has_value());
  EXPECT_EQ(lost.error(), error::codec::disconnected);
  EXPECT_EQ(source.endpoint, lost.error().source_url());
  EXPECT_TRUE(stream.is_terminated());

  async::context cx{async::waker{}};
  const expect<message> after = stream.poll_next(cx);
  ASSERT_FALSE(after.has_value());
  EXPECT_EQ(after.error(), error::codec::terminated);
}

TEST(CheckedStream, DeliversMessages)
{
  const test::repeater source{test::hash_block};
  auto wait = async::subscribe_async_wait_handshake_timeout(
    {source.endpoint()}, std::chrono::seconds{10}
  );
  expect<async::monitor_stream> connected = async::block_on(wait);
  ASSERT_TRUE(connected.has_value()) << connected.error().message();

  async::checked_stream stream{std::move(*connected)};
  const expect<message> next = async::block_on_next(stream);
  ASSERT_TRUE(next.has_value()) << next.error().message();
  EXPECT_EQ(topic::hash_block, next->kind());
}

TEST(Sleep, ReadyAfterDuration)
{
  async::sleep timer{std::chrono::milliseconds{20}};
  async::context cx{async::waker{}};
  EXPECT_TRUE(async::is_pending(timer.poll(cx)));

  const expect<void> done = async::block_on(timer);
  EXPECT_TRUE(bool(done));
}

TEST(Timeout, TimerWins)
{
  auto slow = async::with_timeout(
    async::sleep{std::chrono::seconds{30}}, std::chrono::milliseconds{20}
  );
  const expect<void> result = async::block_on(slow);
  ASSERT_TRUE(result.has_error());
  EXPECT_EQ(result.error(), error::codec::timeout);
}

TEST(Timeout, FutureWins)
{
  auto fast = async::with_timeout(
    async::sleep{std::chrono::milliseconds{10}}, std::chrono::seconds{30}
  );
  const expect<void> result = async::block_on(fast);
  EXPECT_TRUE(bool(result));
}
