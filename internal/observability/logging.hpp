#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace issueflow::runtime::config {
class RuntimeConfig;
}

namespace issueflow::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Keys shared by every flow command, so one grep follows an issue or an agent.
LogField IssueField(std::string_view issue_id);
LogField ActorField(std::string_view actor);
LogField CommandField(std::string_view command);
LogField OutcomeField(std::string_view result_tag);
LogField ErrorField(std::string_view what);

// Logs go to stderr: stdout carries the JSON result envelope. Fields are
// rendered as key=value; values with spaces, quotes or '=' are double-quoted.
void InitializeLogging(const issueflow::runtime::config::RuntimeConfig& config);
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

} // namespace issueflow::observability

#define ISSUEFLOW_LOG_DEBUG(message, ...) ::issueflow::observability::LogDebug((message), ##__VA_ARGS__)
#define ISSUEFLOW_LOG_INFO(message, ...) ::issueflow::observability::LogInfo((message), ##__VA_ARGS__)
#define ISSUEFLOW_LOG_WARN(message, ...) ::issueflow::observability::LogWarn((message), ##__VA_ARGS__)
#define ISSUEFLOW_LOG_ERROR(message, ...) ::issueflow::observability::LogError((message), ##__VA_ARGS__)
