#ifndef GRIDSYNC_CONFIG_HPP
#define GRIDSYNC_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <boost/log/trivial.hpp>

namespace gridsync {
namespace config {

struct BucketConfig {
  static constexpr uint32_t DEFAULT_CHUNK_SIZE = 255 * 1024;
  // Largest chunk a single stored document can hold
  static constexpr uint32_t MAX_CHUNK_SIZE = 16 * 1024 * 1024;
  static constexpr std::size_t MAX_WORKER_THREADS = 256;

  // file://<root> for the filesystem bucket
  std::string connection_string{"file://gridsync_data"};
  std::string database{"gridsync"};
  std::string bucket{"fs"};
  uint32_t chunk_size{DEFAULT_CHUNK_SIZE};
  std::size_t worker_threads{2};
  boost::log::trivial::severity_level log_level{boost::log::trivial::info};

  // Throws ConfigError describing the first invalid field
  void validate() const;
  // Root directory named by the connection string
  std::filesystem::path root_path() const;
};

// Defaults overridden by GRIDSYNC_URI, GRIDSYNC_DATABASE, GRIDSYNC_BUCKET,
// GRIDSYNC_CHUNK_SIZE, GRIDSYNC_WORKERS and GRIDSYNC_LOG_LEVEL. The result
// is validated.
BucketConfig load_config_from_env();

} // namespace config
} // namespace gridsync

#endif // GRIDSYNC_CONFIG_HPP
