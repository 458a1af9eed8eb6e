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

#pragma once

#include <memory>

namespace flowexpr {
namespace utils {

class Logger {
 public:
  virtual ~Logger();

  enum class Level { TRACE_, DEBUG_, INFO_, WARN_, ERROR_ };

  void log(Level level, const char *format, ...);

  virtual bool isLoggable(Level level) = 0;

 protected:
  virtual void writeBuffer(Level level, const char *buffer) = 0;
};

// Writes to stderr every message at or above the given level.
class ThresholdLogger : public Logger {
 public:
  explicit ThresholdLogger(Level threshold) : threshold_(threshold) {}

  bool isLoggable(Level level) override;

 protected:
  void writeBuffer(Level level, const char *buffer) override;

 private:
  Level threshold_;
};

extern const char *levelString(Logger::Level level);

extern void setLogger(std::unique_ptr<Logger> logger);
extern Logger &getLogger();

}  // namespace utils
}  // namespace flowexpr

#define FLOWEXPR_STRINGLIT2(x) #x
#define FLOWEXPR_STRINGLIT(x) FLOWEXPR_STRINGLIT2(x)
#define FLOWEXPR_FILE_LINE \
  "[" __FILE__ ":" FLOWEXPR_STRINGLIT(__LINE__) "] "

#define FLOWEXPR_TRACE_ENABLED         \
  (flowexpr::utils::getLogger().isLoggable( \
      flowexpr::utils::Logger::Level::TRACE_))
#define FLOWEXPR_DEBUG_ENABLED         \
  (flowexpr::utils::getLogger().isLoggable( \
      flowexpr::utils::Logger::Level::DEBUG_))
#define FLOWEXPR_INFO_ENABLED          \
  (flowexpr::utils::getLogger().isLoggable( \
      flowexpr::utils::Logger::Level::INFO_))
#define FLOWEXPR_WARN_ENABLED          \
  (flowexpr::utils::getLogger().isLoggable( \
      flowexpr::utils::Logger::Level::WARN_))
#define FLOWEXPR_ERROR_ENABLED         \
  (flowexpr::utils::getLogger().isLoggable( \
      flowexpr::utils::Logger::Level::ERROR_))

#define FLOWEXPR_TRACE_INT(FORMAT, ...)                                    \
  flowexpr::utils::getLogger().log(flowexpr::utils::Logger::Level::TRACE_, \
                                   FLOWEXPR_FILE_LINE FORMAT, ##__VA_ARGS__)
#define FLOWEXPR_DEBUG_INT(FORMAT, ...)                                    \
  flowexpr::utils::getLogger().log(flowexpr::utils::Logger::Level::DEBUG_, \
                                   FLOWEXPR_FILE_LINE FORMAT, ##__VA_ARGS__)
#define FLOWEXPR_INFO_INT(FORMAT, ...)                                    \
  flowexpr::utils::getLogger().log(flowexpr::utils::Logger::Level::INFO_, \
                                   FLOWEXPR_FILE_LINE FORMAT, ##__VA_ARGS__)
#define FLOWEXPR_WARN_INT(FORMAT, ...)                                    \
  flowexpr::utils::getLogger().log(flowexpr::utils::Logger::Level::WARN_, \
                                   FLOWEXPR_FILE_LINE FORMAT, ##__VA_ARGS__)
#define FLOWEXPR_ERROR_INT(FORMAT, ...)                                    \
  flowexpr::utils::getLogger().log(flowexpr::utils::Logger::Level::ERROR_, \
                                   FLOWEXPR_FILE_LINE FORMAT, ##__VA_ARGS__)

#define FLOWEXPR_TRACE(FORMAT, ...)              \
  do {                                           \
    if (FLOWEXPR_TRACE_ENABLED) {                \
      FLOWEXPR_TRACE_INT(FORMAT, ##__VA_ARGS__); \
    }                                            \
  } while (0)

#define FLOWEXPR_DEBUG(FORMAT, ...)              \
  do {                                           \
    if (FLOWEXPR_DEBUG_ENABLED) {                \
      FLOWEXPR_DEBUG_INT(FORMAT, ##__VA_ARGS__); \
    }                                            \
  } while (0)

#define FLOWEXPR_INFO(FORMAT, ...)              \
  do {                                          \
    if (FLOWEXPR_INFO_ENABLED) {                \
      FLOWEXPR_INFO_INT(FORMAT, ##__VA_ARGS__); \
    }                                           \
  } while (0)

#define FLOWEXPR_WARN(FORMAT, ...)              \
  do {                                          \
    if (FLOWEXPR_WARN_ENABLED) {                \
      FLOWEXPR_WARN_INT(FORMAT, ##__VA_ARGS__); \
    }                                           \
  } while (0)

#define FLOWEXPR_ERROR(FORMAT, ...)              \
  do {                                           \
    if (FLOWEXPR_ERROR_ENABLED) {                \
      FLOWEXPR_ERROR_INT(FORMAT, ##__VA_ARGS__); \
    }                                            \
  } while (0)
