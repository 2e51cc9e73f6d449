#ifndef GRIDSYNC_TYPES_OBJECT_ID_HPP
#define GRIDSYNC_TYPES_OBJECT_ID_HPP

#include <array>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace gridsync {
namespace types {

// 12-byte identifier: 4-byte creation second (big endian), 5 process-random
// bytes, 3-byte counter (big endian)
class ObjectId {
public:
  static constexpr size_t SIZE = 12;
  using Bytes = std::array<uint8_t, SIZE>;

  // ---- CONSTRUCTION ----
  // All-zero identifier, never handed out by generate()
  ObjectId();
  explicit ObjectId(const Bytes& bytes);

  // Creates a fresh identifier
  static ObjectId generate();
  // Parses 24 hex characters, throws std::invalid_argument otherwise
  static ObjectId from_hex(const std::string& hex);


  // ---- ACCESSORS ----
  std::string to_hex() const;
  const Bytes& bytes() const { return bytes_; }
  // Creation time in seconds since epoch
  uint32_t timestamp() const;
  bool is_null() const;

  bool operator==(const ObjectId& other) const { return bytes_ == other.bytes_; }
  bool operator!=(const ObjectId& other) const { return bytes_ != other.bytes_; }
  bool operator<(const ObjectId& other) const { return bytes_ < other.bytes_; }

private:
  Bytes bytes_;
};

std::ostream& operator<<(std::ostream& os, const ObjectId& id);

} // namespace types
} // namespace gridsync

namespace std {
template <>
struct hash<gridsync::types::ObjectId> {
  size_t operator()(const gridsync::types::ObjectId& id) const {
    size_t seed = 0;
    for (uint8_t b : id.bytes()) {
      seed = seed * 131 + b;
    }
    return seed;
  }
};
} // namespace std

#endif // GRIDSYNC_TYPES_OBJECT_ID_HPP
