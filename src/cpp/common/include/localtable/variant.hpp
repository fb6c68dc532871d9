// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <variant>
#include <vector>

namespace localtable {

// clang-format off
// Row-major element buffer of a numeric array
using NumericBuffer =
    std::variant<
        std::vector<std::uint8_t>,
        std::vector<std::uint16_t>,
        std::vector<std::uint32_t>,
        std::vector<std::uint64_t>,
        std::vector<std::int8_t>,
        std::vector<std::int16_t>,
        std::vector<std::int32_t>,
        std::vector<std::int64_t>,
        std::vector<float>,
        std::vector<double>
    >;
// clang-format on

}  // namespace localtable
