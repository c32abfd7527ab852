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

#ifndef BTCZMQ_BITCOIN_ERROR_HPP
#define BTCZMQ_BITCOIN_ERROR_HPP

#include <system_error>
#include <type_traits>

namespace btczmq
{
namespace bitcoin
{
namespace error
{
  /*! Failures decoding consensus serialized blocks and transactions. The
      codec reports only success or failure, so the kinds are coarse. */
  enum class deserialization : int
  {
    none = 0,
    invalid_transaction, //!< Transaction encoding rejected by the codec
    invalid_block,       //!< Block encoding rejected by the codec
    trailing_data        //!< Bytes left over after the object
  };

  //! \return Static string describing `value`.
  const char* get_string(deserialization value) noexcept;

  const std::error_category& deserialization_category() noexcept;

  inline std::error_code make_error_code(const deserialization value) noexcept
  {
    return std::error_code{int(value), deserialization_category()};
  }
} // error
} // bitcoin
} // btczmq

namespace std
{
  template<>
  struct is_error_code_enum<::btczmq::bitcoin::error::deserialization>
    : true_type
  {};
}

#endif // BTCZMQ_BITCOIN_ERROR_HPP
