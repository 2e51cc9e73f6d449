#include "store/record_codec.hpp"
#include "error/blob_error.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>
#include <string>

namespace gridsync {
namespace store {

constexpr char RecordCodec::MAGIC[4];

//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

std::size_t RecordCodec::serialize(const types::ObjectRecord& record, std::ostream& output) {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Record codec: Invalid output stream state";
    throw RemoteError("Record codec: Invalid output stream");
  }

  BOOST_LOG_TRIVIAL(debug) << "Record codec: Serializing record " << record.id
                           << " for name: " << record.name;

  std::size_t total_bytes = 0;

  write_bytes(output, MAGIC, sizeof(MAGIC));
  total_bytes += sizeof(MAGIC);

  write_bytes(output, record.id.bytes().data(), types::ObjectId::SIZE);
  total_bytes += types::ObjectId::SIZE;

  write_integer<uint32_t>(output, static_cast<uint32_t>(record.name.size()));
  write_bytes(output, record.name.data(), record.name.size());
  total_bytes += sizeof(uint32_t) + record.name.size();

  write_integer<uint64_t>(output, record.length);
  write_integer<uint32_t>(output, record.chunk_size);
  write_integer<uint32_t>(output, record.chunk_count);
  total_bytes += sizeof(uint64_t) + 2 * sizeof(uint32_t);

  write_integer<uint32_t>(output, static_cast<uint32_t>(record.checksum.size()));
  write_bytes(output, record.checksum.data(), record.checksum.size());
  total_bytes += sizeof(uint32_t) + record.checksum.size();

  write_integer<int64_t>(output, record.upload_date);
  total_bytes += sizeof(int64_t);

  output.flush();
  if (!output.good()) {
    throw RemoteError("Record codec: Failed to flush record " + record.id.to_hex());
  }

  BOOST_LOG_TRIVIAL(debug) << "Record codec: Serialization complete. Total bytes written: " << total_bytes;
  return total_bytes;
}

types::ObjectRecord RecordCodec::deserialize(std::istream& input) {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Record codec: Invalid input stream state";
    throw RemoteError("Record codec: Invalid input stream");
  }

  char magic[sizeof(MAGIC)];
  read_bytes(input, magic, sizeof(magic));
  if (std::memcmp(magic, MAGIC, sizeof(MAGIC)) != 0) {
    BOOST_LOG_TRIVIAL(error) << "Record codec: Bad record magic";
    throw RemoteError("Record codec: Bad record magic");
  }

  types::ObjectRecord record;

  types::ObjectId::Bytes id_bytes{};
  read_bytes(input, id_bytes.data(), id_bytes.size());
  record.id = types::ObjectId(id_bytes);

  record.name = read_field(input, "name");
  record.length = read_integer<uint64_t>(input);
  record.chunk_size = read_integer<uint32_t>(input);
  record.chunk_count = read_integer<uint32_t>(input);
  record.checksum = read_field(input, "checksum");
  record.upload_date = read_integer<int64_t>(input);

  BOOST_LOG_TRIVIAL(debug) << "Record codec: Deserialized record " << record.id
                           << " (" << record.length << " bytes) for name: " << record.name;
  return record;
}


//==============================================
// STREAM OPERATIONS
//==============================================

void RecordCodec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!output.write(static_cast<const char*>(data), static_cast<std::streamsize>(size))) {
    throw RemoteError("Record codec: Failed to write " + std::to_string(size) + " bytes");
  }
}

void RecordCodec::read_bytes(std::istream& input, void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!input.read(static_cast<char*>(data), static_cast<std::streamsize>(size))) {
    BOOST_LOG_TRIVIAL(error) << "Record codec: Truncated record, expected " << size
                             << " bytes, got " << input.gcount();
    throw RemoteError("Record codec: Truncated record");
  }
}

std::string RecordCodec::read_field(std::istream& input, const char* field_name) {
  uint32_t length = read_integer<uint32_t>(input);
  if (length > MAX_FIELD_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Record codec: Field " << field_name
                             << " length out of range: " << length;
    throw RemoteError(std::string("Record codec: Field length out of range: ") + field_name);
  }
  std::string value(length, '\0');
  read_bytes(input, value.data(), length);
  return value;
}

} // namespace store
} // namespace gridsync
