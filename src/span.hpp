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

#ifndef BTCZMQ_SPAN_HPP
#define BTCZMQ_SPAN_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <type_traits>

namespace btczmq
{
  /*! Non-owning sequence of `T` values. Does not support `remove_` of a
      `size()` larger than the span, these are clamped instead. */
  template<typename T>
  class span
  {
    T* ptr;
    std::size_t len;

  public:
    using value_type = typename std::remove_cv<T>::type;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;
    using pointer = T*;
    using const_pointer = const T*;
    using reference = T&;
    using const_reference = const T&;
    using iterator = pointer;
    using const_iterator = const_pointer;

    constexpr span() noexcept : ptr(nullptr), len(0) {}
    constexpr span(std::nullptr_t) noexcept : span() {}

    //! Prevent conversion from `U*` to `T*` when `sizeof(U) != sizeof(T)`.
    template<typename U, typename = typename std::enable_if<std::is_convertible<U*, T*>::value && sizeof(U) == sizeof(T)>::type>
    constexpr span(U* const src_ptr, const std::size_t count) noexcept
      : ptr(src_ptr), len(count) {}

    template<std::size_t N>
    constexpr span(T (&src)[N]) noexcept : span(src, N) {}

    //! Conversion from `span<U>` to `span<const U>`.
    template<typename U, typename = typename std::enable_if<std::is_convertible<U*, T*>::value && sizeof(U) == sizeof(T)>::type>
    constexpr span(const span<U>& src) noexcept
      : ptr(src.data()), len(src.size()) {}

    constexpr span(const span&) noexcept = default;
    span& operator=(const span&) noexcept = default;

    //! \return Number of elements removed from the front.
    std::size_t remove_prefix(std::size_t amount) noexcept
    {
      amount = std::min(len, amount);
      ptr += amount;
      len -= amount;
      return amount;
    }

    //! \return Subspan starting at `offset` of at most `count` elements.
    span subspan(std::size_t offset, std::size_t count = std::size_t(-1)) const noexcept
    {
      offset = std::min(len, offset);
      return {ptr + offset, std::min(len - offset, count)};
    }

    constexpr iterator begin() const noexcept { return ptr; }
    constexpr const_iterator cbegin() const noexcept { return ptr; }

    constexpr iterator end() const noexcept { return begin() + size(); }
    constexpr const_iterator cend() const noexcept { return cbegin() + size(); }

    constexpr bool empty() const noexcept { return size() == 0; }
    constexpr pointer data() const noexcept { return ptr; }
    constexpr std::size_t size() const noexcept { return len; }
    constexpr std::size_t size_bytes() const noexcept { return size() * sizeof(value_type); }

    T& operator[](std::size_t index) const noexcept { return ptr[index]; }
  };

  //! \return `span<const T::value_type>` from a contiguous container.
  template<typename T>
  constexpr span<const typename T::value_type> to_span(const T& src)
  {
    return {src.data(), src.size()};
  }

  //! \return `span<T::value_type>` from a contiguous container.
  template<typename T>
  constexpr span<typename T::value_type> to_mut_span(T& src)
  {
    return {src.data(), src.size()};
  }

  //! \return `span<const std::uint8_t>` of the bytes in `src`.
  inline span<const std::uint8_t> to_byte_span(const std::string& src) noexcept
  {
    return {reinterpret_cast<const std::uint8_t*>(src.data()), src.size()};
  }

  //! \return `span<const std::uint8_t>` of a null-terminated string, without the null.
  inline span<const std::uint8_t> strspan(const char* src) noexcept
  {
    return {reinterpret_cast<const std::uint8_t*>(src), std::strlen(src)};
  }

  //! \return True if `left` and `right` hold the same bytes.
  inline bool equal(const span<const std::uint8_t> left, const span<const std::uint8_t> right) noexcept
  {
    return left.size() == right.size() &&
      (left.empty() || std::memcmp(left.data(), right.data(), left.size()) == 0);
  }
}

#endif // BTCZMQ_SPAN_HPP
