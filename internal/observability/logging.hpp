#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace datagraph::runtime::config {
class RuntimeConfig;
}

namespace datagraph::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// key=value pairs separated by single spaces. Values that are empty or hold
// whitespace, quotes or '=' are double-quoted with \" and \\ escapes.
std::string FormatFields(std::initializer_list<LogField> fields);

/*
  Installs the "datagraph" stderr logger as the spdlog default. Level and
  pattern come from DATAGRAPH_LOG_LEVEL / DATAGRAPH_LOG_PATTERN when set,
  then from the logging block. Safe to call again.
*/
void InitializeLogging(const datagraph::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// One line: message, then fields, then trace_id/span_id of the active span
// when trace context is enabled.
void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace datagraph::observability

#define DATAGRAPH_LOG_INFO(message, ...) ::datagraph::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define DATAGRAPH_LOG_WARN(message, ...) ::datagraph::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define DATAGRAPH_LOG_ERROR(message, ...) ::datagraph::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
