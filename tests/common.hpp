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

#ifndef BTCZMQ_TESTS_COMMON_HPP
#define BTCZMQ_TESTS_COMMON_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include <zmq.h>

#include "async/context.hpp"
#include "bitcoin/codec.hpp"
#include "expect.hpp"
#include "zmq.hpp"

namespace btczmq
{
namespace test
{
  //! Coinbase transaction of the main network genesis block.
  constexpr const char genesis_tx_hex[] =
    "01000000010000000000000000000000000000000000000000000000000000000000000000ffffffff4d"
    "04ffff001d0104455468652054696d65732030332f4a616e2f32303039204368616e63656c6c6f7220"
    "6f6e206272696e6b206f66207365636f6e64206261696c6f757420666f722062616e6b73ffffffff01"
    "00f2052a01000000434104678afdb0fe5548271967f1a67130b7105cd6a828e03909a67962e0ea1f61"
    "deb649f6bc3f4cef38c4f35504e51ec112de5c384df7ba0b8d578a4c702b6bf11d5fac00000000";

  //! Header of the main network genesis block.
  constexpr const char genesis_header_hex[] =
    "0100000000000000000000000000000000000000000000000000000000000000000000003ba3edfd"
    "7a7b12b27ac72c3e67768f617fc81bc3888a51323a9fb8aa4b1e5e4a29ab5f49ffff001d1dac2b7c";

  constexpr const char genesis_txid[] =
    "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b";

  constexpr const char genesis_block_hash[] =
    "000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f";

  inline std::vector<std::uint8_t> from_hex(const std::string& hex)
  {
    libbitcoin::system::data_chunk out{};
    if (!libbitcoin::system::decode_base16(out, hex))
      throw std::invalid_argument{"invalid hex in test data"};
    return out;
  }

  inline std::vector<std::uint8_t> genesis_tx_bytes()
  {
    return from_hex(genesis_tx_hex);
  }

  inline std::vector<std::uint8_t> genesis_block_bytes()
  {
    return from_hex(std::string{genesis_header_hex} + "01" + genesis_tx_hex);
  }

  inline std::vector<std::uint8_t> bytes(const std::string& source)
  {
    return {source.begin(), source.end()};
  }

  //! Send every frame of `parts` as one multipart message.
  inline void send(void* socket, const zmq::multipart& parts)
  {
    for (std::size_t i = 0; i < parts.size(); ++i)
    {
      const int flags = i + 1 < parts.size() ? ZMQ_SNDMORE : 0;
      if (zmq_send(socket, parts[i].data(), parts[i].size(), flags) < 0)
        BTCZMQ_ZMQ_THROW("zmq_send failed");
    }
  }

  //! PUB socket bound to an ephemeral local TCP port.
  struct publisher
  {
    zmq::context ctx;
    zmq::socket socket;
    std::string endpoint;

    publisher()
      : ctx(BTCZMQ_UNWRAP(zmq::make_context())),
        socket(BTCZMQ_UNWRAP(zmq::make_socket(ctx.get(), ZMQ_PUB))),
        endpoint()
    {
      if (zmq_bind(socket.get(), "tcp://127.0.0.1:*") != 0)
        BTCZMQ_ZMQ_THROW("zmq_bind failed");

      char last[256] = {0};
      std::size_t length = sizeof(last);
      if (zmq_getsockopt(socket.get(), ZMQ_LAST_ENDPOINT, last, &length) != 0)
        BTCZMQ_ZMQ_THROW("ZMQ_LAST_ENDPOINT failed");
      endpoint = last;
    }

    void send(const zmq::multipart& parts)
    {
      test::send(socket.get(), parts);
    }
  };

  //! Publishes a message every few milliseconds on a background thread until destroyed.
  class repeater
  {
    publisher pub_;
    std::atomic<bool> stop_;
    std::thread thread_;

  public:
    //! \param make is called with an increasing counter for every message.
    explicit repeater(std::function<zmq::multipart(std::uint32_t)> make)
      : pub_(), stop_(false), thread_()
    {
      thread_ = std::thread{[this, make] ()
      {
        for (std::uint32_t i = 0; !stop_; ++i)
        {
          pub_.send(make(i));
          std::this_thread::sleep_for(std::chrono::milliseconds{10});
        }
      }};
    }

    repeater(const repeater&) = delete;
    repeater& operator=(const repeater&) = delete;

    ~repeater() noexcept
    {
      stop_ = true;
      if (thread_.joinable())
        thread_.join();
    }

    const std::string& endpoint() const noexcept { return pub_.endpoint; }
  };

  //! `hashblock` message with every hash byte set to `sequence`.
  inline zmq::multipart hash_block(const std::uint32_t sequence)
  {
    return {
      bytes("hashblock"),
      std::vector<std::uint8_t>(32, std::uint8_t(sequence)),
      std::vector<std::uint8_t>{
        std::uint8_t(sequence), std::uint8_t(sequence >> 8), std::uint8_t(sequence >> 16), std::uint8_t(sequence >> 24)
      }
    };
  }

  //! Poll `stream` until it yields an item or `limit` passes.
  template<typename S>
  auto poll_for(S& stream, const std::chrono::milliseconds limit)
    -> decltype(stream.poll_next(std::declval<async::context&>()))
  {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    for (;;)
    {
      async::context cx{async::waker{}};
      auto out = stream.poll_next(cx);
      if (!async::is_pending(out) || deadline <= std::chrono::steady_clock::now())
        return out;
      std::this_thread::sleep_for(std::chrono::milliseconds{5});
    }
  }
} // test
} // btczmq

#endif // BTCZMQ_TESTS_COMMON_HPP
