#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace fleet::runtime::config {
class RuntimeConfig;
}

namespace fleet::observability {

// Installs the global tracer provider; false when tracing is off or compiled out.
bool InitializeTracing(const fleet::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  Active span for the enclosing block. The fields of the calling thread's
  ScopedLogContext (instance_id, job, command_id) are copied onto the span
  as attributes when it starts, so traces and log lines share their keys.

  Without ENABLE_OTEL, or before InitializeTracing, every member is a no-op.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  // Marks the span failed.
  void RecordException(std::string_view description);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace fleet::observability
