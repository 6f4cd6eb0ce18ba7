#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>

namespace sampledir::runtime::config {
class RuntimeConfig;
}

namespace sampledir::observability {

// Rendered as `key=value` after the message.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField PathField(std::string_view key, const std::filesystem::path& path);

// 16 raw uuid bytes, printed in canonical form.
LogField UuidField(std::string_view key, std::string_view uuid_bytes);

// Level and pattern come from SAMPLEDIR_LOG_LEVEL / SAMPLEDIR_LOG_PATTERN, then `config`.
void InitializeLogging(const sampledir::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace sampledir::observability

#define SAMPLEDIR_LOG_INFO(message, ...) ::sampledir::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define SAMPLEDIR_LOG_WARN(message, ...) ::sampledir::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define SAMPLEDIR_LOG_ERROR(message, ...) ::sampledir::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
