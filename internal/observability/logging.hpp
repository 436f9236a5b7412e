#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace infragraph::runtime::config {
class RuntimeConfig;
}

namespace infragraph::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);

// scope=head, scope=cs:<id> or scope=cs:<id>/es:<id>; names the tier a
// call worked against so one grep follows a change set through its sessions.
LogField ScopeField(std::string_view change_set_id, std::string_view edit_session_id = {});

void InitializeLogging(const infragraph::runtime::config::RuntimeConfig& config);
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

} // namespace infragraph::observability

#define INFRAGRAPH_LOG_DEBUG(message, ...) ::infragraph::observability::LogDebug((message), ##__VA_ARGS__)
#define INFRAGRAPH_LOG_INFO(message, ...) ::infragraph::observability::LogInfo((message), ##__VA_ARGS__)
#define INFRAGRAPH_LOG_WARN(message, ...) ::infragraph::observability::LogWarn((message), ##__VA_ARGS__)
#define INFRAGRAPH_LOG_ERROR(message, ...) ::infragraph::observability::LogError((message), ##__VA_ARGS__)
