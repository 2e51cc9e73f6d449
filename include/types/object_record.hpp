#ifndef GRIDSYNC_TYPES_OBJECT_RECORD_HPP
#define GRIDSYNC_TYPES_OBJECT_RECORD_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "types/object_id.hpp"

namespace gridsync {
namespace types {

using Bytes = std::vector<uint8_t>;

// Published description of one stored object. Never mutated once published;
// overwriting a name publishes a new record.
struct ObjectRecord {
  ObjectId id;
  std::string name;
  uint64_t length{0};
  uint32_t chunk_size{0};
  uint32_t chunk_count{0};
  // SHA-256 of the content, lowercase hex
  std::string checksum;
  // Microseconds since epoch
  int64_t upload_date{0};

  bool operator==(const ObjectRecord& other) const {
    return id == other.id && name == other.name && length == other.length &&
           chunk_size == other.chunk_size && chunk_count == other.chunk_count &&
           checksum == other.checksum && upload_date == other.upload_date;
  }
};

// Metadata lookup filter; unset fields match everything
struct RecordFilter {
  std::optional<std::string> name;
  std::optional<ObjectId> id;

  static RecordFilter by_name(const std::string& name) {
    RecordFilter filter;
    filter.name = name;
    return filter;
  }

  static RecordFilter by_id(const ObjectId& id) {
    RecordFilter filter;
    filter.id = id;
    return filter;
  }

  bool matches(const ObjectRecord& record) const {
    if (name && *name != record.name) return false;
    if (id && *id != record.id) return false;
    return true;
  }
};

} // namespace types
} // namespace gridsync

#endif // GRIDSYNC_TYPES_OBJECT_RECORD_HPP
