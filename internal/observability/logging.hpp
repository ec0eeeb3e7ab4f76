#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace tkv::runtime::config {
class RuntimeConfig;
}

namespace tkv::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Binary-safe rendering of a store key or member: non-printable bytes as
// \xNN, cut after kMaxKeyFieldBytes input bytes.
LogField KeyField(std::string_view key, std::string_view bytes);

inline constexpr std::size_t kMaxKeyFieldBytes = 96;

// Throws util::InvalidConfig when the resolved level is not an spdlog level name.
void InitializeLogging(const tkv::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

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

} // namespace tkv::observability

// Fields are only built when debug is enabled.
#define TKV_LOG_DEBUG(message, ...)                                     \
  do {                                                                  \
    if (::spdlog::should_log(::spdlog::level::debug)) {                 \
      ::tkv::observability::LogDebug((message), ##__VA_ARGS__);         \
    }                                                                   \
  } while (0)
#define TKV_LOG_INFO(message, ...) ::tkv::observability::LogInfo((message), ##__VA_ARGS__)
#define TKV_LOG_WARN(message, ...) ::tkv::observability::LogWarn((message), ##__VA_ARGS__)
#define TKV_LOG_ERROR(message, ...) ::tkv::observability::LogError((message), ##__VA_ARGS__)
