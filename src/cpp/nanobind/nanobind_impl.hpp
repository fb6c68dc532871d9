// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <Python.h>
#include <fmt/format.h>
#include <nanobind/nanobind.h>

#include <cstdio>
#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace localtable {

namespace internal {
inline void print_warning_to_stderr(const char *msg) noexcept {
  std::fputs("localtable: ", stderr);
  std::fputs(msg, stderr);
  std::fputc('\n', stderr);
}
}  // namespace internal

template <typename... T>
inline void warn(PyObject *category, fmt::format_string<T...> fmt, T &&...args) noexcept {
  try {
    const auto msg = fmt::format(fmt, std::forward<T>(args)...);
    [[maybe_unused]] const nanobind::gil_scoped_acquire gil{};
    if (PyErr_WarnEx(category, msg.c_str(), 1) != 0) {
      // warnings are being turned into exceptions
      PyErr_Clear();
      internal::print_warning_to_stderr(msg.c_str());
    }
  } catch (const std::exception &e) {
    internal::print_warning_to_stderr(e.what());
  }
}

template <typename T>
[[nodiscard]] inline nanobind::capsule make_capsule(std::unique_ptr<T> ptr, const char *name) {
  [[maybe_unused]] const nanobind::gil_scoped_acquire gil{};
  nanobind::capsule capsule{ptr.get(), name, [](void *p) noexcept {
                              std::unique_ptr<T>{static_cast<T *>(p)}.reset();
                            }};
  // the capsule owns ptr from here on
  ptr.release();  // NOLINT(*-unused-return-value)
  return capsule;
}

}  // namespace localtable
