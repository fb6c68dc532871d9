// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/create_table.hpp"

#include <arrow/table.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "localtable/arrow_type.hpp"
#include "localtable/common.hpp"
#include "localtable/errors.hpp"
#include "localtable/frame.hpp"
#include "localtable/local_data_to_arrow.hpp"
#include "localtable/ndarray.hpp"
#include "localtable/reconciler.hpp"
#include "localtable/schema_inference.hpp"
#include "localtable/session_context.hpp"
#include "localtable/table.hpp"
#include "localtable/type.hpp"
#include "localtable/value.hpp"

namespace localtable {

InputShape classify_input(const LocalData &data) noexcept {
  return std::visit(overloaded{[](const TableHandle &) { return InputShape::RELATION; },
                               [](const Frame &) { return InputShape::FRAME; },
                               [](const NDArray &) { return InputShape::ARRAY; },
                               [](const RecordSequence &) { return InputShape::SEQUENCE; }},
                    data);
}

std::string_view to_string(InputShape shape) noexcept {
  switch (shape) {
    case InputShape::RELATION:
      return "relation";
    case InputShape::FRAME:
      return "frame";
    case InputShape::ARRAY:
      return "array";
    case InputShape::SEQUENCE:
      return "sequence";
  }
  return "unknown";
}

[[nodiscard]] static Value sort_map_by_key(MapValue map) {
  const auto all_strings = std::all_of(map.keys.begin(), map.keys.end(),
                                       [](const Value &k) { return k.is<std::string>(); });
  if (!all_strings) {
    return map;
  }

  std::vector<std::size_t> idx(map.keys.size());
  std::iota(idx.begin(), idx.end(), std::size_t{0});
  std::stable_sort(idx.begin(), idx.end(), [&](std::size_t i1, std::size_t i2) {
    return map.keys[i1].get<std::string>() < map.keys[i2].get<std::string>();
  });

  MapValue sorted{};
  sorted.keys.reserve(idx.size());
  sorted.values.reserve(idx.size());
  for (const auto i : idx) {
    sorted.keys.emplace_back(std::move(map.keys[i]));
    sorted.values.emplace_back(std::move(map.values[i]));
  }
  return sorted;
}

RecordSequence normalize_records(RecordSequence records) {
  for (auto &record : records) {
    if (record.is<MapValue>()) {
      record = sort_map_by_key(record.get<MapValue>());
      continue;
    }
    if (record.is<ListValue>() || record.is<RowValue>() || record.is<ObjectValue>()) {
      continue;
    }
    record = Value::row({"value"}, {std::move(record)});
  }
  return records;
}

namespace {

// Schema argument after DDL strings have been parsed
struct ResolvedSchema {
  std::optional<DataType> full_schema{};
  std::vector<std::string> column_names{};
  std::optional<std::int64_t> expected_num_columns{};
};

[[nodiscard]] ResolvedSchema resolve_schema(const SchemaArg &schema, const SessionContext &ctx) {
  auto from_type = [](DataType type) {
    ResolvedSchema resolved{};
    resolved.expected_num_columns =
        type.is_struct() ? static_cast<std::int64_t>(type.get<StructType>().size()) : 1;
    resolved.full_schema = std::move(type);
    return resolved;
  };

  return std::visit(
      overloaded{[](const std::monostate &) { return ResolvedSchema{}; },
                 [&](const DataType &type) { return from_type(type); },
                 [&](const std::string &ddl) {
                   SPDLOG_DEBUG(FMT_STRING("parsing schema \"{}\"..."), ddl);
                   return from_type(ctx.parse_ddl(ddl));
                 },
                 [](const std::vector<std::string> &names) {
                   ResolvedSchema resolved{};
                   if (!names.empty()) {
                     resolved.column_names = names;
                     resolved.expected_num_columns = static_cast<std::int64_t>(names.size());
                   }
                   return resolved;
                 }},
      schema);
}

[[nodiscard]] bool is_empty(const LocalData &data) noexcept {
  return std::visit(overloaded{[](const TableHandle &) { return false; },
                               [](const Frame &frame) { return frame.empty(); },
                               [](const NDArray &array) { return array.empty(); },
                               [](const RecordSequence &records) { return records.empty(); }},
                    data);
}

[[nodiscard]] LocalRelation create_from_frame(const Frame &frame, ResolvedSchema &schema,
                                              const IngestionOptions &opts) {
  const auto names_given = !schema.column_names.empty();
  auto relation = frame_to_relation(frame, schema.full_schema, schema.column_names, opts);
  if (names_given) {
    schema.expected_num_columns = static_cast<std::int64_t>(schema.column_names.size());
  }
  return relation;
}

[[nodiscard]] LocalRelation create_from_array(const NDArray &array, ResolvedSchema &schema) {
  auto relation = ndarray_to_relation(array, schema.column_names);
  // the array adapter already named the columns
  schema.column_names.clear();
  if (!schema.full_schema.has_value()) {
    return relation;
  }

  relation = reconcile(std::move(relation), schema.expected_num_columns);
  auto struct_schema = as_struct(*schema.full_schema);
  const auto arrow_schema = to_arrow_schema(struct_schema);
  return {cast_table(rename_columns(relation.table, arrow_schema->field_names()), arrow_schema),
          std::move(struct_schema)};
}

[[nodiscard]] LocalRelation create_from_records(const RecordSequence &data, ResolvedSchema &schema,
                                                const IngestionOptions &opts) {
  const auto records = normalize_records(data);

  StructType struct_schema{};
  if (schema.full_schema.has_value()) {
    struct_schema = as_struct(*schema.full_schema);
  } else {
    const InferenceOptions inference_opts{opts.infer_dict_as_struct,
                                          opts.infer_array_from_first_element,
                                          opts.prefer_timestamp_ntz};
    const auto names_given = !schema.column_names.empty();
    struct_schema = infer_schema_from_records(records, schema.column_names, inference_opts);
    if (names_given && schema.expected_num_columns.value_or(0) <
                           static_cast<std::int64_t>(schema.column_names.size())) {
      schema.expected_num_columns = static_cast<std::int64_t>(schema.column_names.size());
    }
    if (!names_given) {
      // generated positional names are already part of the inferred schema
      schema.column_names.clear();
    }

    if (has_null_type(struct_schema)) {
      throw UnresolvedTypeError(struct_schema);
    }
  }

  return {LocalDataToArrowConversion::convert(records, struct_schema, opts.session_timezone),
          struct_schema};
}

}  // namespace

LocalRelation create_table(const LocalData &data, const SchemaArg &schema,
                           const SessionContext &ctx) {
  const auto shape = classify_input(data);
  SPDLOG_DEBUG(FMT_STRING("creating table from {} input..."), to_string(shape));
  if (shape == InputShape::RELATION) {
    throw InvalidInputTypeError("data", "DataFrame");
  }

  auto resolved_schema = resolve_schema(schema, ctx);
  if (resolved_schema.full_schema.has_value()) {
    SPDLOG_DEBUG(FMT_STRING("using schema {}"), resolved_schema.full_schema->simple_string());
  }

  if (shape == InputShape::ARRAY) {
    if (const auto rank = std::get<NDArray>(data).rank(); rank != 1 && rank != 2) {
      throw InvalidRankError(static_cast<std::int64_t>(rank));
    }
  }

  if (is_empty(data)) {
    if (resolved_schema.full_schema.has_value()) {
      SPDLOG_DEBUG("input is empty: returning an empty table");
      return make_empty_relation(as_struct(*resolved_schema.full_schema));
    }
    throw EmptyInputError();
  }

  const auto opts = IngestionOptions::from_context(ctx);

  LocalRelation relation{};
  switch (shape) {
    case InputShape::FRAME:
      relation = create_from_frame(std::get<Frame>(data), resolved_schema, opts);
      break;
    case InputShape::ARRAY:
      relation = create_from_array(std::get<NDArray>(data), resolved_schema);
      break;
    case InputShape::SEQUENCE:
      relation = create_from_records(std::get<RecordSequence>(data), resolved_schema, opts);
      break;
    case InputShape::RELATION:
      unreachable_code();
  }

  relation = reconcile(std::move(relation), resolved_schema.expected_num_columns,
                       resolved_schema.column_names);
  SPDLOG_DEBUG(FMT_STRING("created table with {} row(s) and {} column(s): [{}]"),
               relation.num_rows(), relation.num_columns(),
               fmt::join(relation.column_names(), ", "));
  return relation;
}

}  // namespace localtable
