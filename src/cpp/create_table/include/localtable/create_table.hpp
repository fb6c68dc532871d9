// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "localtable/frame.hpp"
#include "localtable/ndarray.hpp"
#include "localtable/session_context.hpp"
#include "localtable/table.hpp"
#include "localtable/type.hpp"
#include "localtable/value.hpp"

namespace localtable {

// A relation that was already produced, which is not valid input.
struct TableHandle {
  LocalRelation relation{};
};

using RecordSequence = std::vector<Value>;

// clang-format off
using LocalData =
    std::variant<
        TableHandle,
        Frame,
        NDArray,
        RecordSequence
    >;

// Full schema as a DataType or as a DDL string, or a list of column names
using SchemaArg =
    std::variant<
        std::monostate,
        DataType,
        std::string,
        std::vector<std::string>
    >;
// clang-format on

enum class InputShape : std::uint_fast8_t { RELATION, FRAME, ARRAY, SEQUENCE };

[[nodiscard]] InputShape classify_input(const LocalData &data) noexcept;
[[nodiscard]] std::string_view to_string(InputShape shape) noexcept;

// Sorts the entries of map records by key and wraps scalars into
// single-field rows named "value".
[[nodiscard]] RecordSequence normalize_records(RecordSequence records);

[[nodiscard]] LocalRelation create_table(const LocalData &data, const SchemaArg &schema,
                                         const SessionContext &ctx);

}  // namespace localtable
