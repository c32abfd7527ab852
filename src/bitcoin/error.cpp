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

#include "bitcoin/error.hpp"

#include <string>

namespace btczmq
{
namespace bitcoin
{
namespace error
{
  const char* get_string(const deserialization value) noexcept
  {
    switch (value)
    {
    default:
      break;
    case deserialization::none:
      return "No error (success)";
    case deserialization::invalid_transaction:
      return "invalid transaction encoding";
    case deserialization::invalid_block:
      return "invalid block encoding";
    case deserialization::trailing_data:
      return "data not consumed entirely when decoding";
    }
    return "Unknown btczmq::bitcoin::error::deserialization value";
  }

  namespace
  {
    struct category final : std::error_category
    {
      virtual const char* name() const noexcept override final
      {
        return "btczmq::bitcoin::error::deserialization";
      }

      virtual std::string message(int value) const override final
      {
        return get_string(deserialization(value));
      }

      virtual std::error_condition default_error_condition(int value) const noexcept override final
      {
        if (deserialization(value) == deserialization::none)
          return std::error_condition{};
        return std::error_condition{value, *this};
      }
    };
  }

  const std::error_category& deserialization_category() noexcept
  {
    static const category instance{};
    return instance;
  }
} // error
} // bitcoin
} // btczmq
