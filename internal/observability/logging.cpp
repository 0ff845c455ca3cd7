#include "internal/observability/logging.hpp"

#include <atomic>
#include <cstdlib>
#include <iterator>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace fleet::observability {
namespace {

constexpr char kLoggerName[]     = "fleet-orchestrator";
constexpr char kDefaultLevel[]   = "info";
constexpr char kDefaultPattern[] = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::atomic<bool> g_trace_context{false};

thread_local std::vector<LogField> t_context;

// Environment wins over the file; an empty file value falls back.
std::string Override(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool OverrideFlag(const char* env, bool configured) {
  const char* value = std::getenv(env);
  if (value == nullptr) return configured;
  const std::string_view flag(value);
  return flag == "1" || flag == "true" || flag == "yes";
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '=' || c == '"' || c == '\t' || c == '\n') return true;
  }
  return false;
}

void AppendField(fmt::memory_buffer& out, const LogField& field) {
  if (out.size() > 0) out.push_back(' ');
  fmt::format_to(std::back_inserter(out), "{}=", field.key);
  if (!NeedsQuoting(field.value)) {
    out.append(field.value.data(), field.value.data() + field.value.size());
    return;
  }
  out.push_back('"');
  for (char c : field.value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c == '\n' ? ' ' : c);
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
void AppendTraceIds(fmt::memory_buffer& out) {
  if (!g_trace_context.load(std::memory_order_relaxed)) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;
  const auto ctx = span->GetContext();
  if (!ctx.IsValid()) return;

  char trace_hex[2 * opentelemetry::trace::TraceId::kSize];
  char span_hex[2 * opentelemetry::trace::SpanId::kSize];
  ctx.trace_id().ToLowerBase16(trace_hex);
  ctx.span_id().ToLowerBase16(span_hex);
  AppendField(out, {"trace_id", std::string(trace_hex, sizeof(trace_hex))});
  AppendField(out, {"span_id", std::string(span_hex, sizeof(span_hex))});
}
#else
void AppendTraceIds(fmt::memory_buffer&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), fmt::format("{}", value)};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{:.3f}", value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

ScopedLogContext::ScopedLogContext(std::initializer_list<LogField> fields) : depth_(t_context.size()) {
  t_context.insert(t_context.end(), fields.begin(), fields.end());
}

ScopedLogContext::~ScopedLogContext() {
  t_context.resize(depth_);
}

std::vector<LogField> CurrentLogContext() {
  return t_context;
}

void InitializeLogging(const fleet::runtime::config::RuntimeConfig& config) {
  const auto& section = config.logging();

  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }

  const auto level = spdlog::level::from_str(Override("FLEET_LOG_LEVEL", section.level(), kDefaultLevel));
  logger->set_level(level);
  logger->set_pattern(Override("FLEET_LOG_PATTERN", section.pattern(), kDefaultPattern));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);

  g_trace_context = OverrideFlag("FLEET_LOG_INCLUDE_TRACE_CONTEXT", section.include_trace_context());
}

void ShutdownLogging() {
  if (auto logger = spdlog::default_logger()) {
    logger->flush();
  }
  spdlog::shutdown();
}

std::string RenderFields(std::initializer_list<LogField> fields) {
  fmt::memory_buffer out;
  for (const auto& field : fields) AppendField(out, field);
  for (const auto& field : t_context) AppendField(out, field);
  AppendTraceIds(out);
  return fmt::to_string(out);
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) return;

  const auto rendered = RenderFields(fields);
  if (rendered.empty()) {
    logger->log(level, "{}", message);
  } else {
    logger->log(level, "{} {}", message, rendered);
  }
}

} // namespace fleet::observability
