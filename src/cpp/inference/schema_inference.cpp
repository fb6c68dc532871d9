// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/schema_inference.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "localtable/common.hpp"
#include "localtable/errors.hpp"
#include "localtable/type.hpp"
#include "localtable/value.hpp"

namespace localtable {

[[nodiscard]] static std::string child_path(std::string_view parent, std::string_view child) {
  if (parent.empty()) {
    return std::string{child};
  }
  return fmt::format(FMT_STRING("{}.{}"), parent, child);
}

[[nodiscard]] static std::string positional_name(std::size_t i) {
  return fmt::format(FMT_STRING("_{}"), i + 1);
}

[[nodiscard]] static const std::string &key_as_name(const Value &key) {
  if (!key.is<std::string>()) {
    throw InvalidInputTypeError("key", key.type_name());
  }
  return key.get<std::string>();
}

// Indices of names sorted lexicographically, ties keep their original order.
[[nodiscard]] static std::vector<std::size_t> sorted_order(const std::vector<std::string> &names) {
  std::vector<std::size_t> idx(names.size());
  std::iota(idx.begin(), idx.end(), std::size_t{0});
  std::stable_sort(idx.begin(), idx.end(),
                   [&](std::size_t i1, std::size_t i2) { return names[i1] < names[i2]; });
  return idx;
}

[[nodiscard]] static std::vector<std::string> map_keys_as_names(const MapValue &map) {
  std::vector<std::string> names(map.keys.size());
  std::transform(map.keys.begin(), map.keys.end(), names.begin(),
                 [](const Value &k) { return key_as_name(k); });
  return names;
}

[[nodiscard]] static DataType infer_array_type(const ListValue &list, const InferenceOptions &opts,
                                               std::string_view field_path) {
  const auto path = child_path(field_path, "element");
  if (opts.infer_array_from_first_element) {
    const auto first = std::find_if(list.items.begin(), list.items.end(),
                                    [](const Value &v) { return !v.is_null(); });
    if (first == list.items.end()) {
      return ArrayType{NullType{}, true};
    }
    return ArrayType{infer_type(*first, opts, path), true};
  }

  DataType element_type{NullType{}};
  for (const auto &item : list.items) {
    element_type = merge_types(element_type, infer_type(item, opts, path), path);
  }
  return ArrayType{std::move(element_type), true};
}

[[nodiscard]] static DataType infer_map_type(const MapValue &map, const InferenceOptions &opts,
                                             std::string_view field_path) {
  if (opts.infer_dict_as_struct) {
    std::vector<std::string> names{};
    std::vector<std::size_t> entries{};
    for (std::size_t i = 0; i < map.keys.size(); ++i) {
      if (!map.keys[i].is_null() && !map.values[i].is_null()) {
        names.emplace_back(key_as_name(map.keys[i]));
        entries.emplace_back(i);
      }
    }

    StructType type{};
    for (const auto i : sorted_order(names)) {
      const auto &value = map.values[entries[i]];
      type.add(names[i], infer_type(value, opts, child_path(field_path, names[i])), true);
    }
    return type;
  }

  for (std::size_t i = 0; i < map.keys.size(); ++i) {
    if (!map.keys[i].is_null() && !map.values[i].is_null()) {
      return MapType{infer_type(map.keys[i], opts, child_path(field_path, "key")),
                     infer_type(map.values[i], opts, child_path(field_path, "value")), true};
    }
  }
  return MapType{NullType{}, NullType{}, true};
}

[[nodiscard]] static StructType infer_struct_type(const std::vector<std::string> &names,
                                                  const std::vector<Value> &values,
                                                  const InferenceOptions &opts,
                                                  std::string_view field_path) {
  StructType type{};
  for (std::size_t i = 0; i < values.size(); ++i) {
    type.add(names[i], infer_type(values[i], opts, child_path(field_path, names[i])), true);
  }
  return type;
}

[[nodiscard]] static StructType infer_object_type(const ObjectValue &obj,
                                                  const InferenceOptions &opts,
                                                  std::string_view field_path) {
  StructType type{};
  for (const auto i : sorted_order(obj.names)) {
    type.add(obj.names[i], infer_type(obj.values[i], opts, child_path(field_path, obj.names[i])),
             true);
  }
  return type;
}

[[nodiscard]] static std::vector<std::string> positional_names(std::size_t size) {
  std::vector<std::string> names(size);
  for (std::size_t i = 0; i < size; ++i) {
    names[i] = positional_name(i);
  }
  return names;
}

DataType infer_type(const Value &value, const InferenceOptions &opts,
                    std::string_view field_path) {
  // NOLINTBEGIN(*-avoid-magic-numbers)
  return std::visit(
      overloaded{
          [](const NullValue &) -> DataType { return NullType{}; },
          [](bool) -> DataType { return BooleanType{}; },
          [](std::int64_t) -> DataType { return IntegerType{64}; },
          [](double) -> DataType { return FloatType{64}; },
          [](const DecimalValue &) -> DataType { return DecimalType{38, 18}; },
          [](const std::string &) -> DataType { return StringType{}; },
          [](const BinaryValue &) -> DataType { return BinaryType{}; },
          [](const DateValue &) -> DataType { return DateType{}; },
          [&](const TimestampValue &v) -> DataType {
            return TimestampType{opts.prefer_timestamp_ntz && !v.tz_aware};
          },
          [](const IntervalValue &) -> DataType { return DayTimeIntervalType{}; },
          [&](const ListValue &v) -> DataType { return infer_array_type(v, opts, field_path); },
          [&](const MapValue &v) -> DataType { return infer_map_type(v, opts, field_path); },
          [&](const RowValue &v) -> DataType {
            if (v.is_named()) {
              return infer_struct_type(v.names, v.values, opts, field_path);
            }
            return infer_struct_type(positional_names(v.values.size()), v.values, opts, field_path);
          },
          [&](const ObjectValue &v) -> DataType { return infer_object_type(v, opts, field_path); }},
      value.get());
  // NOLINTEND(*-avoid-magic-numbers)
}

[[nodiscard]] static StructType infer_positional_schema(const std::vector<Value> &values,
                                                        std::vector<std::string> &column_names,
                                                        const InferenceOptions &opts) {
  for (auto i = column_names.size(); i < values.size(); ++i) {
    column_names.emplace_back(positional_name(i));
  }
  return infer_struct_type(column_names, values, opts, "");
}

StructType infer_record_schema(const Value &record, std::vector<std::string> &column_names,
                               const InferenceOptions &opts) {
  if (record.is<MapValue>()) {
    const auto &map = record.get<MapValue>();
    StructType schema{};
    for (const auto i : sorted_order(map_keys_as_names(map))) {
      const auto &name = key_as_name(map.keys[i]);
      schema.add(name, infer_type(map.values[i], opts, name), true);
    }
    return schema;
  }
  if (record.is<ListValue>()) {
    return infer_positional_schema(record.get<ListValue>().items, column_names, opts);
  }
  if (record.is<RowValue>()) {
    const auto &row = record.get<RowValue>();
    if (row.is_named()) {
      return infer_struct_type(row.names, row.values, opts, "");
    }
    return infer_positional_schema(row.values, column_names, opts);
  }
  if (record.is<ObjectValue>()) {
    return infer_object_type(record.get<ObjectValue>(), opts, "");
  }

  return StructType{}.add("value", infer_type(record, opts, "value"), true);
}

StructType infer_schema_from_records(const std::vector<Value> &records,
                                     std::vector<std::string> &column_names,
                                     const InferenceOptions &opts) {
  if (records.empty()) {
    throw EmptyInputError();
  }

  SPDLOG_DEBUG(FMT_STRING("inferring schema from {} record(s)..."), records.size());
  auto schema = infer_record_schema(records.front(), column_names, opts);
  for (std::size_t i = 1; i < records.size(); ++i) {
    schema = merge_types(schema, infer_record_schema(records[i], column_names, opts));
  }
  SPDLOG_DEBUG(FMT_STRING("inferred schema: {}"), DataType{schema}.simple_string());
  return schema;
}

}  // namespace localtable
