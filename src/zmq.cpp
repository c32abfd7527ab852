// Copyright (c) 2019, The Monero Project
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
#include "zmq.hpp"

#include <cassert>
#include <cerrno>
#include <limits>
#include <utility>

#include "log.hpp"

namespace btczmq
{
namespace zmq
{
    const std::error_category& error_category() noexcept
    {
        struct category final : std::error_category
        {
            virtual const char* name() const noexcept override final
            {
                return "btczmq::zmq::error_category()";
            }

            virtual std::string message(int value) const override final
            {
                char const* const msg = zmq_strerror(value);
                if (msg)
                    return msg;
                return "zmq_strerror failure";
            }

            virtual std::error_condition default_error_condition(int value) const noexcept override final
            {
                // maps specific errors to generic `std::errc` cases.
                switch (value)
                {
                case EFSM:
                case ETERM:
                    break;
                default:
                    /* zmq is using cerrno errors. C++ standard indicates that
                       `std::errc` values must be identical to the cerrno value.
                       So just map every zmq specific error to the generic errc
                       equivalent. zmq extensions must be in the switch or they
                       map to a non-existent errc enum value. */
                    return std::errc(value);
                }
                return std::error_condition{value, *this};
            }

        };
        static const category instance{};
        return instance;
    }

    void terminate::call(void* ptr) noexcept
    {
        assert(ptr != nullptr); // see header
        while (zmq_ctx_term(ptr))
        {
            if (zmq_errno() != EINTR)
                break;
        }
    }

    expect<context> make_context()
    {
        context out{zmq_ctx_new()};
        if (!out)
            return get_error_code();
        return {std::move(out)};
    }

    expect<socket> make_socket(void* const ctx, const int type)
    {
        socket out{zmq_socket(ctx, type)};
        if (!out)
            return get_error_code();

        const int linger = 0;
        BTCZMQ_ZMQ_CHECK(zmq_setsockopt(out.get(), ZMQ_LINGER, &linger, sizeof(linger)));
        return {std::move(out)};
    }

    expect<void> connect(void* const socket, const char* const address)
    {
        if (zmq_connect(socket, address) != 0)
        {
            const std::error_code error = get_error_code();
            log::get()->error("Failed to connect socket to {}: {}", address, error.message());
            return error;
        }
        log::get()->debug("Connecting to {}", address);
        return success();
    }

    expect<void> subscribe_all(void* const socket)
    {
        BTCZMQ_ZMQ_CHECK(zmq_setsockopt(socket, ZMQ_SUBSCRIBE, "", 0));
        return success();
    }

    expect<bool> has_more(void* const socket)
    {
        int more = 0;
        std::size_t length = sizeof(more);
        BTCZMQ_ZMQ_CHECK(zmq_getsockopt(socket, ZMQ_RCVMORE, &more, &length));
        return {more != 0};
    }

    expect<std::size_t> receive_frame(const span<std::uint8_t> dest, void* const socket, const int flags)
    {
        const expect<int> length = retry_op(zmq_recv, socket, dest.data(), dest.size(), flags);
        if (!length)
            return length.error();
        return {std::size_t(*length)};
    }

    namespace
    {
        //! RAII wrapper for `zmq_msg_t`.
        class message
        {
            zmq_msg_t handle_;

        public:
            message() noexcept
              : handle_()
            {
                zmq_msg_init(handle());
            }

            message(message&& rhs) = delete;
            message(const message& rhs) = delete;
            message& operator=(message&& rhs) = delete;
            message& operator=(const message& rhs) = delete;

            ~message() noexcept
            {
                zmq_msg_close(handle());
            }

            zmq_msg_t* handle() noexcept
            {
                return std::addressof(handle_);
            }

            const std::uint8_t* data() noexcept
            {
                return static_cast<const std::uint8_t*>(zmq_msg_data(handle()));
            }

            std::size_t size() noexcept
            {
                return zmq_msg_size(handle());
            }
        };

        struct do_receive
        {
            /* ZMQ documentation states that message parts are atomic - either
               all are received or none are. Looking through ZMQ code and
               Github discussions indicates that after part 1 is returned,
               `EAGAIN` cannot be returned to meet these guarantees. Therefore,
               read errors after the first part are treated as a failure for
               the entire message (probably `ETERM`). */
            int operator()(multipart& payload, void* const socket, int flags) const
            {
                static constexpr const int max_out = std::numeric_limits<int>::max();
                message part{};
                for (;;)
                {
                    int last = 0;
                    if ((last = zmq_msg_recv(part.handle(), socket, flags)) < 0)
                        return last;

                    flags &= ~ZMQ_DONTWAIT;
                    payload.emplace_back(part.data(), part.data() + part.size());
                    if (!zmq_msg_more(part.handle()))
                        break;
                }
                return payload.size() < unsigned(max_out) ? int(payload.size()) : max_out;
            }
        };
    } // anonymous

    expect<multipart> receive(void* const socket, const int flags)
    {
        multipart payload{};
        const expect<int> received = retry_op(do_receive{}, payload, socket, flags);
        if (!received)
            return received.error();
        return {std::move(payload)};
    }

    expect<void> monitor(void* const socket, const char* const address, const int events)
    {
        BTCZMQ_ZMQ_CHECK(zmq_socket_monitor(socket, address, events));
        log::get()->debug("Monitoring socket events on {}", address);
        return success();
    }

    expect<void> wait_for(const span<void* const> sockets, const int fd)
    {
        std::vector<zmq_pollitem_t> items{};
        items.reserve(sockets.size() + 1);
        for (void* const socket : sockets)
            items.push_back({socket, 0, ZMQ_POLLIN, 0});
        if (0 <= fd)
            items.push_back({nullptr, fd, ZMQ_POLLIN, 0});

        if (zmq_poll(items.data(), int(items.size()), -1) < 0)
        {
            if (zmq_errno() == EINTR)
                return success();
            return get_error_code();
        }
        return success();
    }
} // zmq
} // btczmq
