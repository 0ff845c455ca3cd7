#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace fleet::runtime::config {
class RuntimeConfig;
}

namespace fleet::observability {

// One key=value pair on a log line.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

/*
  Pushes fields onto the calling thread's log context for the lifetime of
  the object. Every line logged on that thread while it is alive carries
  them after the line's own fields, so a job working one instance or a
  dispatcher task running one command tags everything logged below it.

  Scopes nest and must be destroyed in reverse order of creation, which
  holds for stack objects.
*/
class ScopedLogContext {
 public:
  explicit ScopedLogContext(std::initializer_list<LogField> fields);
  ~ScopedLogContext();

  ScopedLogContext(const ScopedLogContext&)            = delete;
  ScopedLogContext& operator=(const ScopedLogContext&) = delete;

 private:
  std::size_t depth_;
};

// Snapshot of the calling thread's context fields, outermost first.
std::vector<LogField> CurrentLogContext();

void InitializeLogging(const fleet::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Renders the text following the message: fields, thread context, then trace ids.
std::string RenderFields(std::initializer_list<LogField> fields);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace fleet::observability

#define FLEET_LOG_DEBUG(message, ...) ::fleet::observability::LogDebug((message), ##__VA_ARGS__)
#define FLEET_LOG_INFO(message, ...) ::fleet::observability::LogInfo((message), ##__VA_ARGS__)
#define FLEET_LOG_WARN(message, ...) ::fleet::observability::LogWarn((message), ##__VA_ARGS__)
#define FLEET_LOG_ERROR(message, ...) ::fleet::observability::LogError((message), ##__VA_ARGS__)
