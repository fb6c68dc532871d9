// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <stdexcept>

#if defined(__GNUC__) || defined(__clang__)
#define LOCALTABLE_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define LOCALTABLE_UNLIKELY(x) (x)
#endif

namespace localtable {

[[nodiscard]] constexpr bool ndebug_defined() noexcept {
#ifdef NDEBUG
  return true;
#else
  return false;
#endif
}

[[noreturn]] inline void unreachable_code() {
  if constexpr (!ndebug_defined()) {
    throw std::logic_error("Unreachable code");
  }
#if defined(__GNUC__) || defined(__clang__)
  __builtin_unreachable();
#elif defined(_MSC_VER)
  __assume(0);
#endif
}

// https://en.cppreference.com/w/cpp/utility/variant/visit
template <typename... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace localtable
