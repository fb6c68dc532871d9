// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/session_context.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "localtable/ddl.hpp"
#include "localtable/type.hpp"

namespace localtable {

StaticSessionContext::StaticSessionContext(std::map<std::string, std::string, std::less<>> configs)
    : _configs(std::move(configs)) {}

StaticSessionContext &StaticSessionContext::set(std::string key, std::string value) {
  _configs.insert_or_assign(std::move(key), std::move(value));
  return *this;
}

std::vector<std::optional<std::string>> StaticSessionContext::get_configs(
    const std::vector<std::string> &keys) const {
  std::vector<std::optional<std::string>> values(keys.size());
  std::transform(keys.begin(), keys.end(), values.begin(),
                 [&](const auto &key) -> std::optional<std::string> {
                   auto match = _configs.find(key);
                   if (match == _configs.end()) {
                     return {};
                   }
                   return match->second;
                 });
  return values;
}

DataType StaticSessionContext::parse_ddl(std::string_view ddl) const {
  return localtable::parse_ddl(ddl);
}

[[nodiscard]] static bool iequals(std::string_view a, std::string_view b) noexcept {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](unsigned char c1, unsigned char c2) {
           return std::tolower(c1) == std::tolower(c2);
         });
}

// Flags are enabled by the exact string "true"
[[nodiscard]] static bool parse_flag(const std::optional<std::string> &value) noexcept {
  return value.has_value() && *value == "true";
}

IngestionOptions IngestionOptions::from_context(const SessionContext &ctx) {
  const std::vector<std::string> keys{
      std::string{config::INFER_DICT_AS_STRUCT},
      std::string{config::INFER_ARRAY_FROM_FIRST_ELEMENT},
      std::string{config::TIMESTAMP_TYPE},
      std::string{config::SESSION_TIMEZONE},
      std::string{config::SAFE_ARRAY_CAST}};

  const auto values = ctx.get_configs(keys);
  if (values.size() != keys.size()) {
    throw std::runtime_error(
        fmt::format(FMT_STRING("session returned {} config value(s), expected {}"), values.size(),
                    keys.size()));
  }

  IngestionOptions opts{};
  opts.infer_dict_as_struct = parse_flag(values[0]);
  opts.infer_array_from_first_element = parse_flag(values[1]);
  opts.prefer_timestamp_ntz = values[2].has_value() && iequals(*values[2], "TIMESTAMP_NTZ");
  if (values[3].has_value() && !values[3]->empty()) {
    opts.session_timezone = *values[3];
  }
  opts.safe_array_cast = parse_flag(values[4]);  // NOLINT(*-avoid-magic-numbers)

  SPDLOG_DEBUG(
      FMT_STRING("ingestion options: infer_dict_as_struct={}, infer_array_from_first_element={}, "
                 "prefer_timestamp_ntz={}, session_timezone={}, safe_array_cast={}"),
      opts.infer_dict_as_struct, opts.infer_array_from_first_element, opts.prefer_timestamp_ntz,
      opts.session_timezone, opts.safe_array_cast);
  return opts;
}

}  // namespace localtable
