// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "localtable/nanobind.hpp"

namespace localtable {

struct LogRecord {
  std::string logger_name{};
  std::string message{};
  double created{};
  spdlog::level::level_enum level{spdlog::level::info};

  [[nodiscard]] static LogRecord from_spdlog(const spdlog::details::log_msg &msg);
  // Requires the GIL
  [[nodiscard]] nanobind::object to_python() const;
};

// Records are produced by spdlog on threads that may not hold the GIL: they are buffered
// here until Logger::flush() hands them to Python.
// Records pushed while the buffer is full or closed are counted and dropped.
class LogRecordBuffer {
  mutable std::mutex _mtx{};
  std::vector<LogRecord> _records{};
  std::size_t _capacity{};
  std::size_t _num_dropped{};
  bool _closed{false};

 public:
  static constexpr std::size_t DEFAULT_CAPACITY{16'384};

  explicit LogRecordBuffer(std::size_t capacity = DEFAULT_CAPACITY);

  void push(LogRecord record) noexcept;
  // Buffered records and the number of records dropped since the previous call
  [[nodiscard]] std::pair<std::vector<LogRecord>, std::size_t> drain();
  void close() noexcept;
  [[nodiscard]] bool closed() const noexcept;
};

// Installs a spdlog logger named "localtable" as the default logger and forwards its
// records to logging.getLogger("localtable").
class Logger {
  std::shared_ptr<LogRecordBuffer> _buffer{std::make_shared<LogRecordBuffer>()};
  std::shared_ptr<spdlog::logger> _logger{};

 public:
  explicit Logger(spdlog::level::level_enum level = spdlog::level::warn);

  Logger(const Logger &) = delete;
  Logger(Logger &&) noexcept = delete;

  ~Logger() noexcept = default;

  Logger &operator=(const Logger &) = delete;
  Logger &operator=(Logger &&) noexcept = delete;

  // Accepts the levels of Python's logging module, either as int or by name.
  void set_level(const std::variant<std::int64_t, std::string> &level);
  void flush() noexcept;
  void shutdown() noexcept;
};

}  // namespace localtable
