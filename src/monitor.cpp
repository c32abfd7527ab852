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

#include "monitor.hpp"

#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace btczmq
{
  namespace
  {
    constexpr const char replacement_character[] = "\xef\xbf\xbd";

    /*! \return `source` with every ill-formed UTF-8 subsequence replaced
        by U+FFFD. A truncated sequence is replaced once. */
    std::string from_utf8_lossy(const span<const std::uint8_t> source)
    {
      std::string out{};
      out.reserve(source.size());

      std::size_t i = 0;
      while (i < source.size())
      {
        const std::uint8_t lead = source[i];
        if (lead < 0x80)
        {
          out.push_back(char(lead));
          ++i;
          continue;
        }

        std::size_t length = 0;
        std::uint8_t lower = 0x80;
        std::uint8_t upper = 0xbf;
        if (0xc2 <= lead && lead <= 0xdf)
          length = 2;
        else if (0xe0 <= lead && lead <= 0xef)
        {
          length = 3;
          if (lead == 0xe0)
            lower = 0xa0; // overlong
          else if (lead == 0xed)
            upper = 0x9f; // surrogates
        }
        else if (0xf0 <= lead && lead <= 0xf4)
        {
          length = 4;
          if (lead == 0xf0)
            lower = 0x90; // overlong
          else if (lead == 0xf4)
            upper = 0x8f; // above U+10FFFF
        }

        std::size_t valid = 1;
        for (; length && valid < length && i + valid < source.size(); ++valid)
        {
          const std::uint8_t next = source[i + valid];
          if (next < lower || upper < next)
            break;
          lower = 0x80;
          upper = 0xbf;
        }

        if (length && valid == length)
          out.append(reinterpret_cast<const char*>(source.data() + i), length);
        else
          out.append(replacement_character);
        i += valid;
      }
      return out;
    }

    constexpr const socket_event::type known_events[] = {
      socket_event::type::connected,
      socket_event::type::connect_delayed,
      socket_event::type::connect_retried,
      socket_event::type::listening,
      socket_event::type::bind_failed,
      socket_event::type::accepted,
      socket_event::type::accept_failed,
      socket_event::type::closed,
      socket_event::type::close_failed,
      socket_event::type::disconnected,
      socket_event::type::monitor_stopped,
      socket_event::type::handshake_failed_no_detail,
      socket_event::type::handshake_succeeded,
      socket_event::type::handshake_failed_protocol,
      socket_event::type::handshake_failed_auth
    };

    bool carries_fd(const socket_event::type kind) noexcept
    {
      switch (kind)
      {
      case socket_event::type::connected:
      case socket_event::type::listening:
      case socket_event::type::accepted:
      case socket_event::type::closed:
      case socket_event::type::disconnected:
      case socket_event::type::handshake_failed_no_detail:
        return true;
      default:
        break;
      }
      return false;
    }

    bool carries_errno(const socket_event::type kind) noexcept
    {
      switch (kind)
      {
      case socket_event::type::bind_failed:
      case socket_event::type::accept_failed:
      case socket_event::type::close_failed:
        return true;
      default:
        break;
      }
      return false;
    }

    bool carries_data(const socket_event::type kind) noexcept
    {
      switch (kind)
      {
      case socket_event::type::unknown:
      case socket_event::type::connect_retried:
      case socket_event::type::handshake_failed_protocol:
      case socket_event::type::handshake_failed_auth:
        return true;
      default:
        break;
      }
      return carries_fd(kind) || carries_errno(kind);
    }
  } // anonymous

  const char* get_string(const handshake_failure value) noexcept
  {
    switch (value)
    {
    case handshake_failure::zmtp_unspecified:
      return "ZmtpUnspecified";
    case handshake_failure::zmtp_unexpected_command:
      return "ZmtpUnexpectedCommand";
    case handshake_failure::zmtp_invalid_sequence:
      return "ZmtpInvalidSequence";
    case handshake_failure::zmtp_key_exchange:
      return "ZmtpKeyExchange";
    case handshake_failure::zmtp_malformed_command_unspecified:
      return "ZmtpMalformedCommandUnspecified";
    case handshake_failure::zmtp_malformed_command_message:
      return "ZmtpMalformedCommandMessage";
    case handshake_failure::zmtp_malformed_command_hello:
      return "ZmtpMalformedCommandHello";
    case handshake_failure::zmtp_malformed_command_initiate:
      return "ZmtpMalformedCommandInitiate";
    case handshake_failure::zmtp_malformed_command_error:
      return "ZmtpMalformedCommandError";
    case handshake_failure::zmtp_malformed_command_ready:
      return "ZmtpMalformedCommandReady";
    case handshake_failure::zmtp_malformed_command_welcome:
      return "ZmtpMalformedCommandWelcome";
    case handshake_failure::zmtp_invalid_metadata:
      return "ZmtpInvalidMetadata";
    case handshake_failure::zmtp_cryptographic:
      return "ZmtpCryptographic";
    case handshake_failure::zmtp_mechanism_mismatch:
      return "ZmtpMechanismMismatch";
    case handshake_failure::zap_unspecified:
      return "ZapUnspecified";
    case handshake_failure::zap_malformed_reply:
      return "ZapMalformedReply";
    case handshake_failure::zap_bad_request_id:
      return "ZapBadRequestId";
    case handshake_failure::zap_bad_version:
      return "ZapBadVersion";
    case handshake_failure::zap_invalid_status_code:
      return "ZapInvalidStatusCode";
    case handshake_failure::zap_invalid_metadata:
      return "ZapInvalidMetadata";
    default:
      break;
    }
    return nullptr;
  }

  void socket_event::check(const bool valid, const char* field) const
  {
    if (!valid)
      throw std::logic_error{std::string{get_string(kind_)} + " event does not carry " + field};
  }

  socket_event socket_event::make(const type kind, const std::uint32_t data)
  {
    if (kind == type::unknown)
      throw std::logic_error{"socket_event::make requires a known event type"};
    return {kind, std::uint16_t(kind), carries_data(kind) ? data : 0};
  }

  expect<socket_event> socket_event::from_raw(const std::uint16_t event, const std::uint32_t data)
  {
    for (const type kind : known_events)
    {
      if (std::uint16_t(kind) != event)
        continue;

      if (kind == type::handshake_failed_protocol && !get_string(handshake_failure(data)))
        return failure::event_data(event, data);
      return make(kind, data);
    }
    return make_unknown(event, data);
  }

  expect<socket_event> socket_event::from_frame(const span<const std::uint8_t> source)
  {
    if (source.size() != event_frame_length)
      return failure::event_frame_length(source.size());

    std::uint16_t event = 0;
    std::uint32_t data = 0;
    std::memcpy(std::addressof(event), source.data(), sizeof(event));
    std::memcpy(std::addressof(data), source.data() + sizeof(event), sizeof(data));
    return from_raw(event, data);
  }

  bool socket_event::has_data() const noexcept
  {
    return carries_data(kind_);
  }

  int socket_event::fd() const
  {
    check(carries_fd(kind_), "a file descriptor");
    return int(data_);
  }

  std::uint32_t socket_event::interval() const
  {
    check(kind_ == type::connect_retried, "an interval");
    return data_;
  }

  int socket_event::error_number() const
  {
    check(carries_errno(kind_), "an errno");
    return int(data_);
  }

  handshake_failure socket_event::protocol_error() const
  {
    check(kind_ == type::handshake_failed_protocol, "a protocol error");
    return handshake_failure(data_);
  }

  std::uint32_t socket_event::status_code() const
  {
    check(kind_ == type::handshake_failed_auth, "a status code");
    return data_;
  }

  std::array<std::uint8_t, event_frame_length> socket_event::to_frame() const noexcept
  {
    std::array<std::uint8_t, event_frame_length> out{{}};
    std::memcpy(out.data(), std::addressof(event_), sizeof(event_));
    std::memcpy(out.data() + sizeof(event_), std::addressof(data_), sizeof(data_));
    return out;
  }

  const char* get_string(const socket_event::type value) noexcept
  {
    switch (value)
    {
    case socket_event::type::unknown:
      return "Unknown";
    case socket_event::type::connected:
      return "Connected";
    case socket_event::type::connect_delayed:
      return "ConnectDelayed";
    case socket_event::type::connect_retried:
      return "ConnectRetried";
    case socket_event::type::listening:
      return "Listening";
    case socket_event::type::bind_failed:
      return "BindFailed";
    case socket_event::type::accepted:
      return "Accepted";
    case socket_event::type::accept_failed:
      return "AcceptFailed";
    case socket_event::type::closed:
      return "Closed";
    case socket_event::type::close_failed:
      return "CloseFailed";
    case socket_event::type::disconnected:
      return "Disconnected";
    case socket_event::type::monitor_stopped:
      return "MonitorStopped";
    case socket_event::type::handshake_failed_no_detail:
      return "HandshakeFailedNoDetail";
    case socket_event::type::handshake_succeeded:
      return "HandshakeSucceeded";
    case socket_event::type::handshake_failed_protocol:
      return "HandshakeFailedProtocol";
    case socket_event::type::handshake_failed_auth:
      return "HandshakeFailedAuth";
    default:
      break;
    }
    return "Unknown";
  }

  std::string to_string(const socket_event& src)
  {
    std::string out{get_string(src.kind())};
    const socket_event::type kind = src.kind();
    if (kind == socket_event::type::unknown)
    {
      out += "(event=" + std::to_string(src.event_code());
      out += ", data=" + std::to_string(src.data()) + ")";
    }
    else if (carries_fd(kind))
      out += "(fd=" + std::to_string(src.fd()) + ")";
    else if (carries_errno(kind))
      out += "(errno=" + std::to_string(src.error_number()) + ")";
    else if (kind == socket_event::type::connect_retried)
      out += "(interval=" + std::to_string(src.interval()) + ")";
    else if (kind == socket_event::type::handshake_failed_protocol)
      out += std::string{"("} + get_string(src.protocol_error()) + ")";
    else if (kind == socket_event::type::handshake_failed_auth)
      out += "(status_code=" + std::to_string(src.status_code()) + ")";
    return out;
  }

  expect<monitor_message> monitor_message::from_multipart(const span<const frame> frames)
  {
    if (frames.size() != 2)
      return failure::monitor_multipart_length(frames.size());

    const auto event = socket_event::from_frame(frames[0]);
    if (!event)
      return event.error();

    return monitor_message{*event, from_utf8_lossy(frames[1])};
  }

  expect<monitor_message> monitor_message::from_multipart(const zmq::multipart& frames)
  {
    const std::vector<frame> views = to_frames(frames);
    return from_multipart(to_span(views));
  }

  std::string to_string(const monitor_message& src)
  {
    return to_string(src.event) + " from " + src.source_url;
  }

  bool handshake_counter::update(const socket_event& event) noexcept
  {
    switch (event.kind())
    {
    case socket_event::type::handshake_succeeded:
      if (pending_)
        --pending_;
      break;
    case socket_event::type::disconnected:
      ++pending_;
      break;
    default:
      break;
    }
    return done();
  }
}
