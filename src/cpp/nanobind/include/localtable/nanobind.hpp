// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <Python.h>
#include <fmt/format.h>
#include <nanobind/nanobind.h>
#include <nanobind/ndarray.h>
#include <nanobind/stl/map.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/variant.h>
#include <nanobind/stl/vector.h>

#include <memory>
#include <string>
#include <string_view>

namespace localtable {

// Version of an installed Python package, pre-release and local suffixes are ignored
struct PythonPackageVersion {
  int major{};
  int minor{};
  int patch{};

  [[nodiscard]] static PythonPackageVersion parse(std::string_view version);
  [[nodiscard]] std::string to_string() const;
};

[[nodiscard]] bool operator<(const PythonPackageVersion &a, const PythonPackageVersion &b) noexcept;

// Failures to import optional dependencies are reported as ModuleNotFoundError naming the
// feature that requires module_name.
[[nodiscard]] nanobind::module_ import_module_checked(const char *module_name,
                                                      std::string_view required_for);

[[nodiscard]] nanobind::module_ import_pyarrow_checked(
    const PythonPackageVersion &min_version = {16, 0, 0});  // NOLINT(*-avoid-magic-numbers)

// Emits a Python warning of the given category, falls back to stderr when that fails.
template <typename... T>
void warn(PyObject *category, fmt::format_string<T...> fmt, T &&...args) noexcept;

template <typename T>
[[nodiscard]] nanobind::capsule make_capsule(std::unique_ptr<T> ptr, const char *name);

[[nodiscard]] std::string format_py_type(const nanobind::handle &h);

}  // namespace localtable

#include "../../nanobind_impl.hpp"
