// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "localtable/type.hpp"

namespace localtable {

namespace config {
inline constexpr std::string_view INFER_DICT_AS_STRUCT{
    "spark.sql.pyspark.inferNestedDictAsStruct.enabled"};
inline constexpr std::string_view INFER_ARRAY_FROM_FIRST_ELEMENT{
    "spark.sql.pyspark.legacy.inferArrayTypeFromFirstElement.enabled"};
inline constexpr std::string_view TIMESTAMP_TYPE{"spark.sql.timestampType"};
inline constexpr std::string_view SESSION_TIMEZONE{"spark.sql.session.timeZone"};
inline constexpr std::string_view SAFE_ARRAY_CAST{
    "spark.sql.execution.pandas.convertToArrowArraySafely"};
}  // namespace config

// The two capabilities the ingestion pipeline needs from its environment.
class SessionContext {
 public:
  SessionContext() = default;
  SessionContext(const SessionContext &other) = default;
  SessionContext(SessionContext &&other) noexcept = default;
  virtual ~SessionContext() = default;

  SessionContext &operator=(const SessionContext &other) = default;
  SessionContext &operator=(SessionContext &&other) noexcept = default;

  // Returns one entry per key, std::nullopt for keys that are not set.
  [[nodiscard]] virtual std::vector<std::optional<std::string>> get_configs(
      const std::vector<std::string> &keys) const = 0;
  [[nodiscard]] virtual DataType parse_ddl(std::string_view ddl) const = 0;
};

class StaticSessionContext final : public SessionContext {
  std::map<std::string, std::string, std::less<>> _configs{};

 public:
  StaticSessionContext() = default;
  explicit StaticSessionContext(std::map<std::string, std::string, std::less<>> configs);

  StaticSessionContext &set(std::string key, std::string value);

  [[nodiscard]] std::vector<std::optional<std::string>> get_configs(
      const std::vector<std::string> &keys) const override;
  [[nodiscard]] DataType parse_ddl(std::string_view ddl) const override;
};

struct IngestionOptions {
  bool infer_dict_as_struct{false};
  bool infer_array_from_first_element{false};
  bool prefer_timestamp_ntz{false};
  std::string session_timezone{"UTC"};
  bool safe_array_cast{false};

  [[nodiscard]] static IngestionOptions from_context(const SessionContext &ctx);
};

}  // namespace localtable
