/**
* @file expected.hpp
 * @brief Result-type backend for pivot factories.
 *
 * pivot_detail::expected / unexpected resolve to std:: when the standard library
 * ships <expected>, and to TartanLlama's tl:: backport otherwise. Build errors
 * with pivot_detail::make_unexpected(e) so call sites do not rely on
 * class template argument deduction through the alias.
 */
#pragma once

#include <type_traits>
#include <utility>
#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
  #include <expected>
  namespace pivot_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace pivot_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif

namespace pivot_detail {
    template<class E>
    constexpr unexpected<std::decay_t<E>> make_unexpected(E&& e) {
        return unexpected<std::decay_t<E>>(std::forward<E>(e));
    }
}
