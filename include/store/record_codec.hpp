#ifndef GRIDSYNC_STORE_RECORD_CODEC_HPP
#define GRIDSYNC_STORE_RECORD_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <boost/endian/conversion.hpp>
#include "types/object_record.hpp"

namespace gridsync {
namespace store {

// Binary encoding of an ObjectRecord as stored in the files collection:
//   magic "GSR1" | id[12] | u32 name_len | name | u64 length |
//   u32 chunk_size | u32 chunk_count | u32 checksum_len | checksum |
//   i64 upload_date
// All integers in network byte order.
class RecordCodec {
public:
  static constexpr char MAGIC[4] = {'G', 'S', 'R', '1'};
  // Upper bound on name and checksum lengths accepted when decoding
  static constexpr uint32_t MAX_FIELD_SIZE = 64 * 1024;

  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Writes the record and returns the number of bytes written
  static std::size_t serialize(const types::ObjectRecord& record, std::ostream& output);
  // Reads one record, throws RemoteError on malformed or truncated input
  static types::ObjectRecord deserialize(std::istream& input);

private:
  // ---- STREAM OPERATIONS ----
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  static void read_bytes(std::istream& input, void* data, std::size_t size);

  template <typename T>
  static void write_integer(std::ostream& output, T host_value) {
    T network_value = boost::endian::native_to_big(host_value);
    write_bytes(output, &network_value, sizeof(network_value));
  }

  template <typename T>
  static T read_integer(std::istream& input) {
    T network_value{};
    read_bytes(input, &network_value, sizeof(network_value));
    return boost::endian::big_to_native(network_value);
  }

  static std::string read_field(std::istream& input, const char* field_name);
};

} // namespace store
} // namespace gridsync

#endif // GRIDSYNC_STORE_RECORD_CODEC_HPP
