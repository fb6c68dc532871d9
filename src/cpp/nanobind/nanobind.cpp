// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/nanobind.hpp"

#include <Python.h>
#include <fmt/format.h>

#include <charconv>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>

namespace nb = nanobind;

namespace localtable {

PythonPackageVersion PythonPackageVersion::parse(std::string_view version) {
  if (version.empty()) {
    throw std::invalid_argument("unable to parse an empty version string");
  }

  PythonPackageVersion v{};
  const auto *first = version.data();
  const auto *last = version.data() + version.size();  // NOLINT(*-pointer-arithmetic)
  for (auto *component : {&v.major, &v.minor, &v.patch}) {
    if (first == last) {
      break;
    }
    const auto [ptr, ec] = std::from_chars(first, last, *component);
    if (ec != std::errc{}) {
      throw std::invalid_argument(
          fmt::format(FMT_STRING("unable to parse \"{}\" as a version number"), version));
    }
    first = ptr;
    if (first == last || *first != '.') {
      break;
    }
    ++first;  // NOLINT(*-pointer-arithmetic)
  }
  return v;
}

std::string PythonPackageVersion::to_string() const {
  return fmt::format(FMT_STRING("{}.{}.{}"), major, minor, patch);
}

bool operator<(const PythonPackageVersion &a, const PythonPackageVersion &b) noexcept {
  return std::tie(a.major, a.minor, a.patch) < std::tie(b.major, b.minor, b.patch);
}

nb::module_ import_module_checked(const char *module_name, std::string_view required_for) {
  [[maybe_unused]] const nb::gil_scoped_acquire gil{};
  try {
    return nb::module_::import_(module_name);
  } catch (nb::python_error &e) {
    if (!e.matches(PyExc_ImportError)) {
      throw;
    }
    const auto msg =
        fmt::format(FMT_STRING("{} requires {}, please install it with: pip install "
                               "'localtable[{}]'"),
                    required_for, module_name, module_name);
    nb::raise_from(e, PyExc_ModuleNotFoundError, "%s", msg.c_str());  // NOLINT(*-vararg)
  }
}

nb::module_ import_pyarrow_checked(const PythonPackageVersion &min_version) {
  // only accessed while holding the GIL
  static bool version_checked{false};

  [[maybe_unused]] const nb::gil_scoped_acquire gil{};
  auto pa = import_module_checked("pyarrow", "Arrow interoperability");
  if (version_checked) {
    return pa;
  }

  const auto found = PythonPackageVersion::parse(nb::cast<std::string>(pa.attr("__version__")));
  if (found < min_version) {
    const auto msg =
        fmt::format(FMT_STRING("pyarrow {} is too old to be used with localtable: please install "
                               "pyarrow>={} with: pip install 'localtable[pyarrow]'"),
                    found.to_string(), min_version.to_string());
    throw nb::import_error(msg.c_str());
  }

  version_checked = true;
  return pa;
}

std::string format_py_type(const nb::handle &h) {
  [[maybe_unused]] const nb::gil_scoped_acquire gil{};
  if (nb::hasattr(h, "__qualname__")) {
    return nb::cast<std::string>(nb::str(h.attr("__qualname__")));
  }
  return nb::cast<std::string>(nb::str(h.type().attr("__qualname__")));
}

}  // namespace localtable
