#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace tkv::observability {
namespace {

constexpr const char* kLoggerName     = "tkv";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// environment wins over config, config over the default
std::string Resolve(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env); value != nullptr && *value != '\0') {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off
  if (level == spdlog::level::off && name != "off") {
    throw util::InvalidConfig("unknown log level: " + name);
  }
  return level;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=') return true;
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('"');
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out.push_back(' ');
    out.append(field.key);
    out.push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField KeyField(std::string_view key, std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string rendered;
  const auto  shown = bytes.substr(0, kMaxKeyFieldBytes);
  rendered.reserve(shown.size());
  for (unsigned char c : shown) {
    if (c >= 0x20 && c < 0x7f && c != '\\') {
      rendered.push_back(static_cast<char>(c));
      continue;
    }
    rendered += "\\x";
    rendered.push_back(kHex[c >> 4]);
    rendered.push_back(kHex[c & 0x0F]);
  }
  if (bytes.size() > shown.size()) {
    rendered += "...(" + std::to_string(bytes.size()) + " bytes)";
  }
  return {std::string(key), std::move(rendered)};
}

void InitializeLogging(const tkv::runtime::config::RuntimeConfig& config) {
  const auto level   = ParseLevel(Resolve("TKV_LOG_LEVEL", config.logging().level(), "info"));
  const auto pattern = Resolve("TKV_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  // re-initialization replaces the previous logger
  spdlog::drop(kLoggerName);

  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(pattern);
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  if (fields.size() == 0) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, SerializeFields(fields));
}

} // namespace tkv::observability
