/**
 * @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected (C++20).
 *
 * bmux reports every fallible operation as expected<T, Error>. This header
 * picks the implementation so the rest of the library never names one.
 *
 * - In C++23 and later: uses <expected> from the standard library.
 * - In C++20: falls back to <tl/expected.hpp>, the header-only backport
 *   by TartanLlama (https://github.com/TartanLlama/expected).
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
  #include <expected>
  namespace bmux_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace bmux_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
