/* Copyright 2024 The flowexpr Authors. All Rights Reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "src/flowexpr/utils/logger.h"

#include <stdarg.h>
#include <stdio.h>

#include "absl/synchronization/mutex.h"

namespace flowexpr {
namespace utils {

Logger::~Logger() {}

void Logger::log(Level level, const char *format, ...) {
  if (!isLoggable(level)) {
    return;
  }

  va_list args;
  va_start(args, format);
  char buffer[256];
  ::vsnprintf(buffer, sizeof(buffer), format, args);
  buffer[sizeof(buffer) - 1] = 0;
  va_end(args);

  writeBuffer(level, buffer);
}

const char *levelString(Logger::Level level) {
  switch (level) {
    case Logger::Level::TRACE_:
      return "TRACE";
    case Logger::Level::DEBUG_:
      return "DEBUG";
    case Logger::Level::INFO_:
      return "INFO";
    case Logger::Level::WARN_:
      return "WARN";
    case Logger::Level::ERROR_:
      return "ERROR";
  }
  return "UNKNOWN";
}

bool ThresholdLogger::isLoggable(Level level) {
  return static_cast<int>(level) >= static_cast<int>(threshold_);
}

void ThresholdLogger::writeBuffer(Level level, const char *buffer) {
  fprintf(stderr, "%s %s\n", levelString(level), buffer);
}

namespace {

// Used until an embedding application installs its own logger. Validation
// tasks may log from worker threads, so writes are serialized.
class DefaultLogger : public Logger {
 public:
  bool isLoggable(Level level) override {
    switch (level) {
      case Level::TRACE_:
      case Level::DEBUG_:
        return false;
      case Level::INFO_:
      case Level::WARN_:
      case Level::ERROR_:
        return true;
    }
    return false;
  }

 protected:
  void writeBuffer(Level level, const char *buffer) override {
    absl::MutexLock lock(&mutex_);
    fprintf(stderr, "%s %s\n", levelString(level), buffer);
  }

 private:
  absl::Mutex mutex_;
};

std::unique_ptr<Logger> active_logger{new DefaultLogger()};

}  // namespace

void setLogger(std::unique_ptr<Logger> logger) {
  active_logger = std::move(logger);
  FLOWEXPR_INFO("Logger active");
}
Logger &getLogger() { return *active_logger; }

}  // namespace utils
}  // namespace flowexpr
