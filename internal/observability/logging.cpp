#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/uuid.hpp"

namespace sampledir::observability {
namespace {

std::string ResolveLevel(const sampledir::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("SAMPLEDIR_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const sampledir::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("SAMPLEDIR_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField PathField(std::string_view key, const std::filesystem::path& path) {
  return {std::string(key), path.string()};
}

LogField UuidField(std::string_view key, std::string_view uuid_bytes) {
  return {std::string(key), sampledir::util::FormatBytes(std::string(uuid_bytes))};
}

void InitializeLogging(const sampledir::runtime::config::RuntimeConfig& config) {
  // stdout belongs to command output; logs go to stderr.
  auto logger = spdlog::stderr_color_mt("sampledir");
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace sampledir::observability
