#include "types/object_id.hpp"
#include "crypto/digest.hpp"
#include <atomic>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <boost/endian/conversion.hpp>

namespace gridsync {
namespace types {

namespace {

constexpr size_t RANDOM_SIZE = 5;
constexpr size_t COUNTER_SIZE = 3;

// Process-unique bytes, drawn once
const std::vector<uint8_t>& process_random() {
  static const std::vector<uint8_t> value = crypto::random_bytes(RANDOM_SIZE);
  return value;
}

std::atomic<uint32_t>& counter() {
  static std::atomic<uint32_t> value{[] {
    auto seed = crypto::random_bytes(sizeof(uint32_t));
    uint32_t initial = 0;
    std::memcpy(&initial, seed.data(), sizeof(initial));
    return initial & 0x00FFFFFF;
  }()};
  return value;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace


//==============================================
// CONSTRUCTION
//==============================================

ObjectId::ObjectId() : bytes_{} {}

ObjectId::ObjectId(const Bytes& bytes) : bytes_(bytes) {}

ObjectId ObjectId::generate() {
  Bytes bytes{};

  auto now = std::chrono::system_clock::now().time_since_epoch();
  uint32_t seconds = static_cast<uint32_t>(
    std::chrono::duration_cast<std::chrono::seconds>(now).count());
  uint32_t network_seconds = boost::endian::native_to_big(seconds);
  std::memcpy(bytes.data(), &network_seconds, sizeof(network_seconds));

  const auto& random = process_random();
  std::memcpy(bytes.data() + 4, random.data(), RANDOM_SIZE);

  // Low 24 bits of the counter, big endian
  uint32_t count = counter().fetch_add(1) & 0x00FFFFFF;
  uint32_t network_count = boost::endian::native_to_big(count);
  std::memcpy(bytes.data() + 4 + RANDOM_SIZE,
              reinterpret_cast<uint8_t*>(&network_count) + 1, COUNTER_SIZE);

  return ObjectId(bytes);
}

ObjectId ObjectId::from_hex(const std::string& hex) {
  if (hex.size() != SIZE * 2) {
    throw std::invalid_argument("ObjectId: Expected " + std::to_string(SIZE * 2) +
                                " hex characters, got " + std::to_string(hex.size()));
  }

  Bytes bytes{};
  for (size_t i = 0; i < SIZE; ++i) {
    int high = hex_value(hex[2 * i]);
    int low = hex_value(hex[2 * i + 1]);
    if (high < 0 || low < 0) {
      throw std::invalid_argument("ObjectId: Invalid hex character in: " + hex);
    }
    bytes[i] = static_cast<uint8_t>((high << 4) | low);
  }
  return ObjectId(bytes);
}


//==============================================
// ACCESSORS
//==============================================

std::string ObjectId::to_hex() const {
  std::stringstream ss;
  for (uint8_t b : bytes_) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  }
  return ss.str();
}

uint32_t ObjectId::timestamp() const {
  uint32_t network_seconds = 0;
  std::memcpy(&network_seconds, bytes_.data(), sizeof(network_seconds));
  return boost::endian::big_to_native(network_seconds);
}

bool ObjectId::is_null() const {
  for (uint8_t b : bytes_) {
    if (b != 0) return false;
  }
  return true;
}

std::ostream& operator<<(std::ostream& os, const ObjectId& id) {
  return os << id.to_hex();
}

} // namespace types
} // namespace gridsync
