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

#ifndef BTCZMQ_ERROR_HPP
#define BTCZMQ_ERROR_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <type_traits>

#include "span.hpp"

namespace btczmq
{
namespace error
{
  enum class common : int
  {
    none = 0,
    invalid_error_code //!< An `expect<T>` was given a success code
  };

  //! Failures decoding the data channel, and terminal conditions of a subscription.
  enum class codec : int
  {
    none = 0,                        //!< Must be zero for `expect<..>`
    invalid_multipart_length,        //!< Message did not have exactly 3 frames
    unknown_topic,                   //!< Topic frame is not one of the five known topics
    invalid_data_length,             //!< Data frame larger than `data_max_length`
    invalid_sequence_length,         //!< Sequence frame is not 4 bytes
    invalid_sequence_message_length, //!< Sequence record is not 33 or 41 bytes
    invalid_sequence_message_label,  //!< Sequence record label not one of `CDAR`
    invalid_256bit_hash_length,      //!< Hash frame is not 32 bytes
    disconnected,                    //!< Publisher disconnected after handshake
    timeout,                         //!< Operation did not complete in time
    terminated                       //!< Stream or channel has no more items
  };

  //! Failures decoding the monitor channel.
  enum class monitor : int
  {
    none = 0,
    invalid_multipart_length,   //!< Event did not have exactly 2 frames
    invalid_event_frame_length, //!< First frame is not 6 bytes
    invalid_event_data          //!< Event data not valid for the event type
  };

  //! \return Static string describing `value`.
  const char* get_string(common value) noexcept;
  //! \return Static string describing `value`.
  const char* get_string(codec value) noexcept;
  //! \return Static string describing `value`.
  const char* get_string(monitor value) noexcept;

  const std::error_category& common_category() noexcept;
  const std::error_category& codec_category() noexcept;
  const std::error_category& monitor_category() noexcept;

  inline std::error_code make_error_code(const common value) noexcept
  {
    return std::error_code{int(value), common_category()};
  }
  inline std::error_code make_error_code(const codec value) noexcept
  {
    return std::error_code{int(value), codec_category()};
  }
  inline std::error_code make_error_code(const monitor value) noexcept
  {
    return std::error_code{int(value), monitor_category()};
  }
} // error
} // btczmq

namespace std
{
  template<>
  struct is_error_code_enum<::btczmq::error::common>
    : true_type
  {};

  template<>
  struct is_error_code_enum<::btczmq::error::codec>
    : true_type
  {};

  template<>
  struct is_error_code_enum<::btczmq::error::monitor>
    : true_type
  {};
}

namespace btczmq
{
  //! Maximum number of bytes of an unknown topic kept for diagnostics.
  constexpr const std::size_t topic_capture_length = 64;

  /*! An error code and the offending values that produced it. Transport
      errors use `zmq::error_category()`, deserialization errors use
      `bitcoin::error::deserialization_category()`. */
  class failure
  {
    std::string detail_;  //!< Captured topic bytes, or source url
    std::error_code code_;
    std::size_t length_;  //!< Observed length or frame count
    std::uint32_t value_; //!< Label byte, or event data

  public:
    failure() noexcept
      : detail_(), code_(), length_(0), value_(0)
    {}

    failure(const std::error_code code) noexcept
      : detail_(), code_(code), length_(0), value_(0)
    {}

    template<typename E, typename = typename std::enable_if<std::is_error_code_enum<E>::value>::type>
    failure(const E code) noexcept
      : failure(make_error_code(code))
    {}

    failure(std::error_code code, std::size_t length, std::uint32_t value = 0, std::string detail = {})
      : detail_(std::move(detail)), code_(code), length_(length), value_(value)
    {}

    static failure multipart_length(std::size_t count)
    {
      return {error::codec::invalid_multipart_length, count};
    }
    //! Keeps at most `topic_capture_length` bytes of `topic`.
    static failure unknown_topic(span<const std::uint8_t> topic, std::size_t actual_length);
    static failure unknown_topic(span<const std::uint8_t> topic)
    {
      return unknown_topic(topic, topic.size());
    }
    static failure data_length(std::size_t length)
    {
      return {error::codec::invalid_data_length, length};
    }
    static failure sequence_length(std::size_t length)
    {
      return {error::codec::invalid_sequence_length, length};
    }
    static failure sequence_message_length(std::size_t length)
    {
      return {error::codec::invalid_sequence_message_length, length};
    }
    static failure sequence_message_label(std::uint8_t label)
    {
      return {error::codec::invalid_sequence_message_label, 1, label};
    }
    static failure hash_length(std::size_t length)
    {
      return {error::codec::invalid_256bit_hash_length, length};
    }
    static failure disconnected(std::string source_url)
    {
      return {error::codec::disconnected, 0, 0, std::move(source_url)};
    }
    static failure monitor_multipart_length(std::size_t count)
    {
      return {error::monitor::invalid_multipart_length, count};
    }
    static failure event_frame_length(std::size_t length)
    {
      return {error::monitor::invalid_event_frame_length, length};
    }
    static failure event_data(std::uint16_t event, std::uint32_t data)
    {
      return {error::monitor::invalid_event_data, event, data};
    }

    const std::error_code& code() const noexcept { return code_; }

    //! \return Frame count, byte length, or event code depending on `code()`.
    std::size_t length() const noexcept { return length_; }

    //! \return Sequence label byte or monitor event data.
    std::uint32_t value() const noexcept { return value_; }

    //! \return Source url of a `disconnected` failure.
    const std::string& source_url() const noexcept { return detail_; }

    //! \return Captured bytes of an `unknown_topic` failure.
    span<const std::uint8_t> topic() const noexcept { return to_byte_span(detail_); }

    //! \return True if the error originated in the ZMQ library.
    bool is_transport() const noexcept;

    //! \return True if a block or transaction failed consensus decoding.
    bool is_bitcoin_deserialization() const noexcept;

    //! \return True if a monitor channel frame was malformed.
    bool is_monitor() const noexcept
    {
      return code_.category() == error::monitor_category();
    }

    //! \return Human readable description including the offending values.
    std::string message() const;
  };

  inline bool operator==(const failure& lhs, const std::error_code& rhs) noexcept
  {
    return lhs.code() == rhs;
  }
  inline bool operator!=(const failure& lhs, const std::error_code& rhs) noexcept
  {
    return lhs.code() != rhs;
  }
} // btczmq

#endif // BTCZMQ_ERROR_HPP
