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

#ifndef BTCZMQ_EXPECT_HPP
#define BTCZMQ_EXPECT_HPP

#include <cassert>
#include <new>
#include <system_error>
#include <type_traits>
#include <utility>

#include "error.hpp"

//! If `expect<..>` has an error, return it from the current function.
#define BTCZMQ_CHECK(...)                           \
  do                                                \
  {                                                 \
    const auto result = __VA_ARGS__ ;               \
    if (!result)                                    \
      return result.error();                        \
  } while (0)

//! Throw `std::system_error` with `code` and `msg` as the description.
#define BTCZMQ_THROW(code, msg) \
  ::btczmq::detail::expect::throw_( code , msg , __FILE__ , __LINE__ )

//! Unwrap an `expect<..>`, throwing `std::system_error` on error.
#define BTCZMQ_UNWRAP(...) \
  ::btczmq::detail::expect::unwrap( __VA_ARGS__ , nullptr , __FILE__ , __LINE__ )

namespace btczmq
{
  template<typename> class expect;

  namespace detail
  {
    // Shortens the characters in the macros
    struct expect
    {
      [[noreturn]] static void throw_(std::error_code ec, const char* msg, const char* file, unsigned line);
      [[noreturn]] static void throw_(const failure& ec, const char* msg, const char* file, unsigned line);

      template<typename T>
      static T unwrap(::btczmq::expect<T>&& result, const char* error_msg, const char* file, unsigned line)
      {
        if (!result)
          throw_(result.error(), error_msg, file, line);
        return std::move(*result);
      }

      static void unwrap(::btczmq::expect<void>&& result, const char* error_msg, const char* file, unsigned line);
    };
  }

  /*! Holds either a `T` value or a `failure`. A `failure` with a success
      code is replaced with `error::common::invalid_error_code` so that
      `has_error()` is always consistent with the stored code.

      \tparam T must have a `noexcept` destructor and move constructor. */
  template<typename T>
  class expect
  {
    static_assert(std::is_nothrow_destructible<T>(), "T must have a nothrow destructor");

    template<typename U>
    static constexpr bool is_convertible() noexcept
    {
      return std::is_constructible<T, U>() && std::is_convertible<U, T>();
    }

    failure code_;
    typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;

    T& get() noexcept
    {
      assert(!has_error());
      return *reinterpret_cast<T*>(std::addressof(storage_));
    }

    const T& get() const noexcept
    {
      assert(!has_error());
      return *reinterpret_cast<const T*>(std::addressof(storage_));
    }

    template<typename U>
    void store(U&& value) noexcept(std::is_nothrow_constructible<T, U>())
    {
      new (std::addressof(storage_)) T(std::forward<U>(value));
      code_ = failure{};
    }

    void maybe_throw() const
    {
      if (has_error())
        ::btczmq::detail::expect::throw_(error(), nullptr, nullptr, 0);
    }

  public:
    using value_type = T;
    using error_type = failure;

    expect() = delete;

    //! Store an error, `code` should not be a success value.
    expect(failure code) noexcept
      : code_(std::move(code)), storage_()
    {
      if (!has_error())
        code_ = failure{error::common::invalid_error_code};
    }

    expect(const std::error_code code) noexcept
      : expect(failure{code})
    {}

    template<typename E, typename = typename std::enable_if<std::is_error_code_enum<E>::value>::type>
    expect(const E code) noexcept
      : expect(failure{code})
    {}

    //! Store a value, `val`, in the `expect` object.
    expect(T val) noexcept(std::is_nothrow_move_constructible<T>())
      : code_(), storage_()
    {
      store(std::move(val));
    }

    expect(expect const& src) noexcept(std::is_nothrow_copy_constructible<T>())
      : code_(src.code_), storage_()
    {
      if (!src.has_error())
        store(src.get());
    }

    //! Copy conversion from `U` to `T`.
    template<typename U, typename = typename std::enable_if<is_convertible<const U&>()>::type>
    expect(expect<U> const& src) noexcept(std::is_nothrow_constructible<T, U const&>())
      : code_(src.error()), storage_()
    {
      if (!src.has_error())
        store(*src);
    }

    expect(expect&& src) noexcept(std::is_nothrow_move_constructible<T>())
      : code_(src.code_), storage_()
    {
      if (!src.has_error())
        store(std::move(src.get()));
    }

    //! Move conversion from `U` to `T`.
    template<typename U, typename = typename std::enable_if<is_convertible<U>()>::type>
    expect(expect<U>&& src) noexcept(std::is_nothrow_constructible<T, U>())
      : code_(src.error()), storage_()
    {
      if (!src.has_error())
        store(std::move(*src));
    }

    ~expect() noexcept
    {
      if (!has_error())
        get().~T();
    }

    expect& operator=(expect const& src) noexcept(std::is_nothrow_copy_constructible<T>() && std::is_nothrow_copy_assignable<T>())
    {
      if (this != std::addressof(src))
      {
        if (!has_error() && !src.has_error())
          get() = src.get();
        else if (!has_error())
          get().~T();
        else if (!src.has_error())
          store(src.get());
        code_ = src.code_;
      }
      return *this;
    }

    /*! Move `src` into `this`. If `src.has_value() && addressof(src) != this`
        then `src.value() will be in a "moved from state". */
    expect& operator=(expect&& src) noexcept(std::is_nothrow_move_constructible<T>() && std::is_nothrow_move_assignable<T>())
    {
      if (this != std::addressof(src))
      {
        if (!has_error() && !src.has_error())
          get() = std::move(src.get());
        else if (!has_error())
          get().~T();
        else if (!src.has_error())
          store(std::move(src.get()));
        code_ = src.code_;
      }
      return *this;
    }

    //! \return True if `this` is storing a value instead of an error.
    explicit operator bool() const noexcept { return has_value(); }

    //! \return True if `this` is storing an error instead of a value.
    bool has_error() const noexcept { return bool(code_.code()); }

    //! \return True if `this` is storing a value instead of an error.
    bool has_value() const noexcept { return !has_error(); }

    //! \return Error - always safe to call. Empty when `!has_error()`.
    const failure& error() const noexcept { return code_; }

    //! \return Value if `has_value()` otherwise \throw `std::system_error{error()}`.
    T& value() &
    {
      maybe_throw();
      return get();
    }

    //! \return Value if `has_value()` otherwise \throw `std::system_error{error()}`.
    const T& value() const &
    {
      maybe_throw();
      return get();
    }

    /*! Same as other overloads, but expressions such as `foo(bar().value())`
        will automatically perform moves with no copies. */
    T&& value() &&
    {
      maybe_throw();
      return std::move(get());
    }

    //! \return Value, \pre `has_value()`.
    T* operator->() noexcept { return std::addressof(get()); }
    //! \return Value, \pre `has_value()`.
    const T* operator->() const noexcept { return std::addressof(get()); }
    //! \return Value, \pre `has_value()`.
    T& operator*() noexcept { return get(); }
    //! \return Value, \pre `has_value()`.
    const T& operator*() const noexcept { return get(); }

    //! \return True if `has_error()` and `error().code() == rhs`.
    bool matches(std::error_condition const& rhs) const noexcept
    {
      return has_error() && error().code() == rhs;
    }
  };

  template<>
  class expect<void>
  {
    failure code_;

  public:
    using value_type = void;
    using error_type = failure;

    //! Create a successful object.
    expect() noexcept
      : code_()
    {}

    expect(failure code) noexcept
      : code_(std::move(code))
    {
      if (!has_error())
        code_ = failure{error::common::invalid_error_code};
    }

    expect(const std::error_code code) noexcept
      : expect(failure{code})
    {}

    template<typename E, typename = typename std::enable_if<std::is_error_code_enum<E>::value>::type>
    expect(const E code) noexcept
      : expect(failure{code})
    {}

    expect(expect const&) = default;
    expect(expect&&) = default;
    ~expect() = default;
    expect& operator=(expect const&) = default;
    expect& operator=(expect&&) = default;

    //! \return True if `this` is storing a value instead of an error.
    explicit operator bool() const noexcept { return !has_error(); }

    //! \return True if `this` is storing an error instead of a value.
    bool has_error() const noexcept { return bool(code_.code()); }

    //! \return Error - always safe to call. Empty when `!has_error()`.
    const failure& error() const noexcept { return code_; }

    //! \return `error() == rhs.error()`.
    bool equal(expect const& rhs) const noexcept
    {
      return error().code() == rhs.error().code();
    }

    //! \return True if `has_error()` and `error().code() == rhs`.
    bool matches(std::error_condition const& rhs) const noexcept
    {
      return has_error() && error().code() == rhs;
    }
  };

  //! \return An `expect<void>` object with `!has_error()`.
  inline expect<void> success() noexcept { return expect<void>{}; }

  template<typename T>
  inline bool operator==(expect<T> const& lhs, std::error_code const& rhs) noexcept
  {
    return lhs.has_error() && lhs.error().code() == rhs;
  }

  template<typename T>
  inline bool operator!=(expect<T> const& lhs, std::error_code const& rhs) noexcept
  {
    return !(lhs == rhs);
  }

  namespace detail
  {
    inline void expect::unwrap(::btczmq::expect<void>&& result, const char* error_msg, const char* file, unsigned line)
    {
      if (!result)
        throw_(result.error(), error_msg, file, line);
    }
  }
} // btczmq

#endif // BTCZMQ_EXPECT_HPP
