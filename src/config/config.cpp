#include "config/config.hpp"
#include "error/blob_error.hpp"
#include "logger/logger.hpp"
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace gridsync {
namespace config {

namespace {

constexpr const char* FILE_SCHEME = "file://";

void check_name(const std::string& value, const std::string& field) {
  if (value.empty()) {
    throw ConfigError(field + " must not be empty");
  }
  if (value.find('/') != std::string::npos || value.find('\\') != std::string::npos) {
    throw ConfigError(field + " must not contain path separators: " + value);
  }
  if (value == "." || value == "..") {
    throw ConfigError(field + " is not a valid name: " + value);
  }
}

unsigned long long parse_number(const std::string& value, const std::string& variable) {
  // stoull would skip whitespace and wrap a leading minus sign
  if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
    throw ConfigError(variable + " is not a number: " + value);
  }
  try {
    size_t pos = 0;
    unsigned long long number = std::stoull(value, &pos);
    if (pos != value.size()) {
      throw ConfigError(variable + " is not a number: " + value);
    }
    return number;
  } catch (const std::invalid_argument&) {
    throw ConfigError(variable + " is not a number: " + value);
  } catch (const std::out_of_range&) {
    throw ConfigError(variable + " is out of range: " + value);
  }
}

const char* get_env(const char* variable) {
  const char* value = std::getenv(variable);
  return (value && *value) ? value : nullptr;
}

} // namespace

void BucketConfig::validate() const {
  if (connection_string.rfind(FILE_SCHEME, 0) != 0) {
    throw ConfigError("Unsupported connection string: " + connection_string);
  }
  if (connection_string.size() == std::string(FILE_SCHEME).size()) {
    throw ConfigError("Connection string has no path: " + connection_string);
  }
  check_name(database, "Database name");
  check_name(bucket, "Bucket name");
  if (chunk_size == 0 || chunk_size > MAX_CHUNK_SIZE) {
    throw ConfigError("Chunk size must be between 1 and " + std::to_string(MAX_CHUNK_SIZE) +
                      " bytes, got " + std::to_string(chunk_size));
  }
  if (worker_threads == 0 || worker_threads > MAX_WORKER_THREADS) {
    throw ConfigError("Worker threads must be between 1 and " + std::to_string(MAX_WORKER_THREADS) +
                      ", got " + std::to_string(worker_threads));
  }
}

std::filesystem::path BucketConfig::root_path() const {
  if (connection_string.rfind(FILE_SCHEME, 0) != 0) {
    throw ConfigError("Unsupported connection string: " + connection_string);
  }
  return std::filesystem::path(connection_string.substr(std::string(FILE_SCHEME).size()));
}

BucketConfig load_config_from_env() {
  BucketConfig config;

  if (const char* uri = get_env("GRIDSYNC_URI")) {
    config.connection_string = uri;
  }
  if (const char* database = get_env("GRIDSYNC_DATABASE")) {
    config.database = database;
  }
  if (const char* bucket = get_env("GRIDSYNC_BUCKET")) {
    config.bucket = bucket;
  }
  if (const char* chunk_size = get_env("GRIDSYNC_CHUNK_SIZE")) {
    auto value = parse_number(chunk_size, "GRIDSYNC_CHUNK_SIZE");
    if (value > BucketConfig::MAX_CHUNK_SIZE) {
      throw ConfigError("GRIDSYNC_CHUNK_SIZE is out of range: " + std::string(chunk_size));
    }
    config.chunk_size = static_cast<uint32_t>(value);
  }
  if (const char* workers = get_env("GRIDSYNC_WORKERS")) {
    config.worker_threads = static_cast<std::size_t>(parse_number(workers, "GRIDSYNC_WORKERS"));
  }
  if (const char* level = get_env("GRIDSYNC_LOG_LEVEL")) {
    config.log_level = logging::parse_severity(level);
  }

  config.validate();
  return config;
}

} // namespace config
} // namespace gridsync
