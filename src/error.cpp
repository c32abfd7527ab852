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

#include "error.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

#include "bitcoin/error.hpp"
#include "zmq.hpp"

namespace btczmq
{
namespace error
{
  const char* get_string(const common value) noexcept
  {
    switch (value)
    {
    default:
      break;
    case common::none:
      return "No error (success)";
    case common::invalid_error_code:
      return "expect<T> was given an error value of zero";
    }
    return "Unknown btczmq::error::common value";
  }

  const char* get_string(const codec value) noexcept
  {
    switch (value)
    {
    default:
      break;
    case codec::none:
      return "No error (success)";
    case codec::invalid_multipart_length:
      return "invalid multipart message length (expected 3)";
    case codec::unknown_topic:
      return "unknown topic";
    case codec::invalid_data_length:
      return "data frame exceeds maximum length";
    case codec::invalid_sequence_length:
      return "invalid sequence length (expected 4)";
    case codec::invalid_sequence_message_length:
      return "invalid message length of message type 'sequence'";
    case codec::invalid_sequence_message_label:
      return "invalid label of message type 'sequence'";
    case codec::invalid_256bit_hash_length:
      return "invalid hash length (expected 32)";
    case codec::disconnected:
      return "publisher disconnected";
    case codec::timeout:
      return "connection timed out";
    case codec::terminated:
      return "no more items";
    }
    return "Unknown btczmq::error::codec value";
  }

  const char* get_string(const monitor value) noexcept
  {
    switch (value)
    {
    default:
      break;
    case monitor::none:
      return "No error (success)";
    case monitor::invalid_multipart_length:
      return "invalid monitor multipart message length (expected 2)";
    case monitor::invalid_event_frame_length:
      return "invalid event frame length (expected 6)";
    case monitor::invalid_event_data:
      return "invalid event data for event";
    }
    return "Unknown btczmq::error::monitor value";
  }

  namespace
  {
    template<typename E>
    struct category final : std::error_category
    {
      explicit category(const char* name) noexcept
        : name_(name)
      {}

      virtual const char* name() const noexcept override final
      {
        return name_;
      }

      virtual std::string message(int value) const override final
      {
        return get_string(E(value));
      }

      virtual std::error_condition default_error_condition(int value) const noexcept override final
      {
        if (E(value) == E::none)
          return std::error_condition{};
        return std::error_condition{value, *this};
      }

    private:
      const char* const name_;
    };
  }

  const std::error_category& common_category() noexcept
  {
    static const category<common> instance{"btczmq::error::common"};
    return instance;
  }

  const std::error_category& codec_category() noexcept
  {
    static const category<codec> instance{"btczmq::error::codec"};
    return instance;
  }

  const std::error_category& monitor_category() noexcept
  {
    static const category<monitor> instance{"btczmq::error::monitor"};
    return instance;
  }
} // error

  namespace
  {
    //! Printable text of a topic, escaping bytes outside of ASCII.
    std::string escape(const span<const std::uint8_t> bytes)
    {
      std::string out;
      out.reserve(bytes.size());
      for (const std::uint8_t byte : bytes)
      {
        if (std::isprint(byte))
          out.push_back(char(byte));
        else
        {
          char hex[5] = {0};
          std::snprintf(hex, sizeof(hex), "\\x%02x", unsigned(byte));
          out.append(hex);
        }
      }
      return out;
    }
  }

  failure failure::unknown_topic(const span<const std::uint8_t> topic, const std::size_t actual_length)
  {
    const std::size_t captured = std::min(topic.size(), topic_capture_length);
    return {
      error::codec::unknown_topic,
      actual_length,
      0,
      std::string{reinterpret_cast<const char*>(topic.data()), captured}
    };
  }

  bool failure::is_transport() const noexcept
  {
    return code_.category() == zmq::error_category();
  }

  bool failure::is_bitcoin_deserialization() const noexcept
  {
    return code_.category() == bitcoin::error::deserialization_category();
  }

  std::string failure::message() const
  {
    if (code_.category() == error::codec_category())
    {
      switch (error::codec(code_.value()))
      {
      default:
        break;
      case error::codec::invalid_multipart_length:
        return "invalid multipart message length: " + std::to_string(length_) + " (expected 3)";
      case error::codec::unknown_topic:
        return "unknown topic \"" + escape(topic()) + "\"";
      case error::codec::invalid_data_length:
        return "invalid data length: " + std::to_string(length_);
      case error::codec::invalid_sequence_length:
        return "invalid sequence length: " + std::to_string(length_) + " (expected 4)";
      case error::codec::invalid_sequence_message_length:
        return "invalid message length " + std::to_string(length_) + " of message type 'sequence'";
      case error::codec::invalid_sequence_message_label:
      {
        char hex[5] = {0};
        std::snprintf(hex, sizeof(hex), "0x%02x", unsigned(value_ & 0xff));
        const std::uint8_t label = std::uint8_t(value_);
        return "invalid label '" + escape({&label, 1}) + "' (" + hex + ") of message type 'sequence'";
      }
      case error::codec::invalid_256bit_hash_length:
        return "invalid hash length: " + std::to_string(length_) + " (expected 32)";
      case error::codec::disconnected:
        return "disconnected from " + detail_;
      }
    }
    else if (code_.category() == error::monitor_category())
    {
      switch (error::monitor(code_.value()))
      {
      default:
        break;
      case error::monitor::invalid_multipart_length:
        return "invalid multipart message length: " + std::to_string(length_) + " (expected 2)";
      case error::monitor::invalid_event_frame_length:
        return "invalid event frame length: " + std::to_string(length_) + " (expected 6)";
      case error::monitor::invalid_event_data:
        return "invalid event data " + std::to_string(value_) + " for event " + std::to_string(length_);
      }
    }
    else if (is_bitcoin_deserialization())
      return "bitcoin consensus deserialization error: " + code_.message();
    else if (is_transport())
      return "ZMQ Error: " + code_.message();
    return code_.message();
  }
} // btczmq
