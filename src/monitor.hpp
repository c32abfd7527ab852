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

#ifndef BTCZMQ_MONITOR_HPP
#define BTCZMQ_MONITOR_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <zmq.h>

#include "expect.hpp"
#include "message.hpp"
#include "span.hpp"
#include "zmq.hpp"

namespace btczmq
{
  //! Endpoint of the in-process PAIR socket receiving monitor events.
  constexpr const char monitor_endpoint[] = "inproc://monitor";

  //! Length of the first frame of a monitor event.
  constexpr const std::size_t event_frame_length = 6;

  //! Data of a `handshake_failed_protocol` event.
  enum class handshake_failure : std::uint32_t
  {
    zmtp_unspecified = ZMQ_PROTOCOL_ERROR_ZMTP_UNSPECIFIED,
    zmtp_unexpected_command = ZMQ_PROTOCOL_ERROR_ZMTP_UNEXPECTED_COMMAND,
    zmtp_invalid_sequence = ZMQ_PROTOCOL_ERROR_ZMTP_INVALID_SEQUENCE,
    zmtp_key_exchange = ZMQ_PROTOCOL_ERROR_ZMTP_KEY_EXCHANGE,
    zmtp_malformed_command_unspecified = ZMQ_PROTOCOL_ERROR_ZMTP_MALFORMED_COMMAND_UNSPECIFIED,
    zmtp_malformed_command_message = ZMQ_PROTOCOL_ERROR_ZMTP_MALFORMED_COMMAND_MESSAGE,
    zmtp_malformed_command_hello = ZMQ_PROTOCOL_ERROR_ZMTP_MALFORMED_COMMAND_HELLO,
    zmtp_malformed_command_initiate = ZMQ_PROTOCOL_ERROR_ZMTP_MALFORMED_COMMAND_INITIATE,
    zmtp_malformed_command_error = ZMQ_PROTOCOL_ERROR_ZMTP_MALFORMED_COMMAND_ERROR,
    zmtp_malformed_command_ready = ZMQ_PROTOCOL_ERROR_ZMTP_MALFORMED_COMMAND_READY,
    zmtp_malformed_command_welcome = ZMQ_PROTOCOL_ERROR_ZMTP_MALFORMED_COMMAND_WELCOME,
    zmtp_invalid_metadata = ZMQ_PROTOCOL_ERROR_ZMTP_INVALID_METADATA,
    zmtp_cryptographic = ZMQ_PROTOCOL_ERROR_ZMTP_CRYPTOGRAPHIC,
    zmtp_mechanism_mismatch = ZMQ_PROTOCOL_ERROR_ZMTP_MECHANISM_MISMATCH,
    zap_unspecified = ZMQ_PROTOCOL_ERROR_ZAP_UNSPECIFIED,
    zap_malformed_reply = ZMQ_PROTOCOL_ERROR_ZAP_MALFORMED_REPLY,
    zap_bad_request_id = ZMQ_PROTOCOL_ERROR_ZAP_BAD_REQUEST_ID,
    zap_bad_version = ZMQ_PROTOCOL_ERROR_ZAP_BAD_VERSION,
    zap_invalid_status_code = ZMQ_PROTOCOL_ERROR_ZAP_INVALID_STATUS_CODE,
    zap_invalid_metadata = ZMQ_PROTOCOL_ERROR_ZAP_INVALID_METADATA
  };

  //! \return Static name of `value`, or nullptr if not a known protocol error.
  const char* get_string(handshake_failure value) noexcept;

  //! An event reported by `zmq_socket_monitor`.
  class socket_event
  {
  public:
    enum class type : std::uint16_t
    {
      unknown = 0, //!< Event code not known, see `event_code()`
      connected = ZMQ_EVENT_CONNECTED,
      connect_delayed = ZMQ_EVENT_CONNECT_DELAYED,
      connect_retried = ZMQ_EVENT_CONNECT_RETRIED,
      listening = ZMQ_EVENT_LISTENING,
      bind_failed = ZMQ_EVENT_BIND_FAILED,
      accepted = ZMQ_EVENT_ACCEPTED,
      accept_failed = ZMQ_EVENT_ACCEPT_FAILED,
      closed = ZMQ_EVENT_CLOSED,
      close_failed = ZMQ_EVENT_CLOSE_FAILED,
      disconnected = ZMQ_EVENT_DISCONNECTED,
      monitor_stopped = ZMQ_EVENT_MONITOR_STOPPED,
      handshake_failed_no_detail = ZMQ_EVENT_HANDSHAKE_FAILED_NO_DETAIL,
      handshake_succeeded = ZMQ_EVENT_HANDSHAKE_SUCCEEDED,
      handshake_failed_protocol = ZMQ_EVENT_HANDSHAKE_FAILED_PROTOCOL,
      handshake_failed_auth = ZMQ_EVENT_HANDSHAKE_FAILED_AUTH
    };

  private:
    std::uint32_t data_;
    std::uint16_t event_;
    type kind_;

    socket_event(type kind, std::uint16_t event, std::uint32_t data) noexcept
      : data_(data), event_(event), kind_(kind)
    {}

    void check(bool valid, const char* field) const;

  public:
    //! Default is `unknown` with zero event code and data.
    socket_event() noexcept
      : socket_event(type::unknown, 0, 0)
    {}

    /*! Event of `kind` with `data`. `data` is discarded for events that
        carry none. \throw std::logic_error if `kind == type::unknown`. */
    static socket_event make(type kind, std::uint32_t data = 0);

    //! \return An `unknown` event, keeping `event` and `data`.
    static socket_event make_unknown(std::uint16_t event, std::uint32_t data) noexcept
    {
      return {type::unknown, event, data};
    }

    /*! \return Event from its code and data. Unknown codes are kept in an
        `unknown` event. A `handshake_failed_protocol` with an unknown
        protocol error is `error::monitor::invalid_event_data`. */
    static expect<socket_event> from_raw(std::uint16_t event, std::uint32_t data);

    /*! \return Event from the 6 byte first frame of a monitor message,
        a native-order `uint16_t` event code and `uint32_t` data. */
    static expect<socket_event> from_frame(span<const std::uint8_t> source);

    type kind() const noexcept { return kind_; }
    std::uint16_t event_code() const noexcept { return event_; }
    std::uint32_t data() const noexcept { return data_; }

    //! \return True if the event carries a value in `data()`.
    bool has_data() const noexcept;

    //! \return File descriptor of a connected, listening, accepted, closed, disconnected or handshake_failed_no_detail event.
    int fd() const;

    //! \return Reconnect interval in milliseconds of a `connect_retried` event.
    std::uint32_t interval() const;

    //! \return `errno` of a bind_failed, accept_failed, or close_failed event.
    int error_number() const;

    //! \return Reason of a `handshake_failed_protocol` event.
    handshake_failure protocol_error() const;

    //! \return ZAP status code of a `handshake_failed_auth` event.
    std::uint32_t status_code() const;

    //! \return The 6 byte first frame of a monitor message.
    std::array<std::uint8_t, event_frame_length> to_frame() const noexcept;
  };

  inline bool operator==(const socket_event& lhs, const socket_event& rhs) noexcept
  {
    return lhs.event_code() == rhs.event_code() && lhs.data() == rhs.data();
  }
  inline bool operator!=(const socket_event& lhs, const socket_event& rhs) noexcept
  {
    return !(lhs == rhs);
  }

  //! \return Static name of `value`, such as `HandshakeSucceeded`.
  const char* get_string(socket_event::type value) noexcept;

  //! \return `Connected(fd=7)` or `HandshakeSucceeded` form.
  std::string to_string(const socket_event& src);

  //! An event and the endpoint it occurred on.
  struct monitor_message
  {
    socket_event event;
    std::string source_url; //!< Invalid UTF-8 in the frame is replaced with U+FFFD

    //! \return Message from exactly two frames, the event and the endpoint.
    static expect<monitor_message> from_multipart(span<const frame> frames);
    static expect<monitor_message> from_multipart(const zmq::multipart& frames);
  };

  inline bool operator==(const monitor_message& lhs, const monitor_message& rhs)
  {
    return lhs.event == rhs.event && lhs.source_url == rhs.source_url;
  }
  inline bool operator!=(const monitor_message& lhs, const monitor_message& rhs)
  {
    return !(lhs == rhs);
  }

  //! \return `<event> from <source_url>` form.
  std::string to_string(const monitor_message& src);

  /*! Tracks outstanding handshakes of a subscription. Success decrements
      the pending count, disconnect increments it, other events are
      ignored. */
  class handshake_counter
  {
    std::size_t pending_;

  public:
    explicit handshake_counter(std::size_t endpoints) noexcept
      : pending_(endpoints)
    {}

    //! \return True if no handshakes are pending after applying `event`.
    bool update(const socket_event& event) noexcept;

    std::size_t pending() const noexcept { return pending_; }
    bool done() const noexcept { return pending_ == 0; }
  };
}

#endif // BTCZMQ_MONITOR_HPP
