// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#include "localtable/logger.hpp"

#include <fmt/format.h>
#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <new>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include "localtable/common.hpp"
#include "localtable/nanobind.hpp"

namespace nb = nanobind;

namespace localtable {

namespace {

struct LevelMapping {
  spdlog::level::level_enum spdlog_level;
  std::int64_t py_level;
};

// https://docs.python.org/3/library/logging.html#logging-levels
// Sorted by decreasing severity
// NOLINTBEGIN(*-avoid-magic-numbers)
constexpr std::array<LevelMapping, 5> LEVEL_MAPPINGS{{{spdlog::level::critical, 50},
                                                      {spdlog::level::err, 40},
                                                      {spdlog::level::warn, 30},
                                                      {spdlog::level::info, 20},
                                                      {spdlog::level::debug, 10}}};
// NOLINTEND(*-avoid-magic-numbers)

[[nodiscard]] std::int64_t to_py_level(spdlog::level::level_enum level) noexcept {
  const auto match = std::find_if(LEVEL_MAPPINGS.begin(), LEVEL_MAPPINGS.end(),
                                  [&](const auto &m) { return m.spdlog_level == level; });
  // trace has no Python counterpart
  return match == LEVEL_MAPPINGS.end() ? LEVEL_MAPPINGS.back().py_level : match->py_level;
}

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(std::int64_t py_level) noexcept {
  if (py_level > LEVEL_MAPPINGS.front().py_level) {
    return spdlog::level::off;
  }
  const auto match = std::find_if(LEVEL_MAPPINGS.begin(), LEVEL_MAPPINGS.end(),
                                  [&](const auto &m) { return py_level >= m.py_level; });
  return match == LEVEL_MAPPINGS.end() ? spdlog::level::trace : match->spdlog_level;
}

// Requires the GIL
[[nodiscard]] nb::object get_py_logger() {
  return nb::module_::import_("logging").attr("getLogger")("localtable");
}

// Requires the GIL
[[nodiscard]] std::int64_t lookup_py_level(std::string name) {
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  const auto level = nb::module_::import_("logging").attr("getLevelName")(name);
  if (!nb::isinstance<nb::int_>(level)) {
    throw std::invalid_argument(fmt::format(FMT_STRING("unknown log level \"{}\""), name));
  }
  return nb::cast<std::int64_t>(level);
}

}  // namespace

LogRecord LogRecord::from_spdlog(const spdlog::details::log_msg &msg) {
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(msg.time.time_since_epoch()).count();
  return {std::string{msg.logger_name.data(), msg.logger_name.size()},
          std::string{msg.payload.data(), msg.payload.size()},
          static_cast<double>(micros) / 1.0e6,  // NOLINT(*-avoid-magic-numbers)
          msg.level};
}

nb::object LogRecord::to_python() const {
  auto record = nb::module_::import_("logging").attr("LogRecord")(
      logger_name.empty() ? std::string{"localtable"} : logger_name, to_py_level(level), "", 0,
      message, nb::tuple(), nb::none());
  record.attr("created") = created;
  return record;
}

LogRecordBuffer::LogRecordBuffer(std::size_t capacity) : _capacity(capacity) {}

void LogRecordBuffer::push(LogRecord record) noexcept {
  [[maybe_unused]] const std::scoped_lock lck{_mtx};
  if (_closed) {
    return;
  }
  if (_records.size() >= _capacity) {
    ++_num_dropped;
    return;
  }
  try {
    _records.emplace_back(std::move(record));
  } catch (const std::bad_alloc &) {
    ++_num_dropped;
  }
}

std::pair<std::vector<LogRecord>, std::size_t> LogRecordBuffer::drain() {
  std::vector<LogRecord> records{};
  [[maybe_unused]] const std::scoped_lock lck{_mtx};
  std::swap(records, _records);
  return {std::move(records), std::exchange(_num_dropped, 0)};
}

void LogRecordBuffer::close() noexcept {
  [[maybe_unused]] const std::scoped_lock lck{_mtx};
  _closed = true;
}

bool LogRecordBuffer::closed() const noexcept {
  [[maybe_unused]] const std::scoped_lock lck{_mtx};
  return _closed;
}

Logger::Logger(spdlog::level::level_enum level) {
  auto sink = std::make_shared<spdlog::sinks::callback_sink_mt>(
      [buffer = _buffer](const spdlog::details::log_msg &msg) {
        buffer->push(LogRecord::from_spdlog(msg));
      });
  sink->set_pattern("%v");

  _logger = std::make_shared<spdlog::logger>("localtable", std::move(sink));
  _logger->set_level(level);
  spdlog::set_default_logger(_logger);
}

void Logger::set_level(const std::variant<std::int64_t, std::string> &level) {
  [[maybe_unused]] const nb::gil_scoped_acquire gil{};
  const auto py_level = std::visit(
      overloaded{[](std::int64_t lvl) { return lvl; },
                 [](const std::string &name) { return lookup_py_level(name); }},
      level);

  std::ignore = get_py_logger().attr("setLevel")(py_level);
  _logger->set_level(to_spdlog_level(py_level));
}

void Logger::flush() noexcept {
  try {
    [[maybe_unused]] const nb::gil_scoped_acquire gil{};
    auto [records, num_dropped] = _buffer->drain();
    if (records.empty() && num_dropped == 0) {
      return;
    }

    auto py_logger = get_py_logger();
    for (const auto &record : records) {
      std::ignore = py_logger.attr("handle")(record.to_python());
    }
    if (num_dropped != 0) {
      std::ignore = py_logger.attr("warning")(
          fmt::format(FMT_STRING("{} log record(s) were dropped: the log buffer was full"),
                      num_dropped));
    }
  } catch (nb::python_error &e) {
    e.discard_as_unraisable("localtable.logging.flush");
  } catch (const std::exception &e) {
    warn(PyExc_RuntimeWarning, FMT_STRING("failed to forward log records to Python: {}"),
         e.what());
  }
}

void Logger::shutdown() noexcept {
  flush();
  _buffer->close();
  _logger->set_level(spdlog::level::off);
}

}  // namespace localtable
