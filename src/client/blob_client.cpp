#include "client/blob_client.hpp"
#include "error/blob_error.hpp"
#include "store/file_bucket.hpp"
#include <vector>
#include <boost/locale/encoding_utf.hpp>
#include <boost/log/trivial.hpp>

namespace gridsync {
namespace client {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BlobClient::BlobClient(const config::BucketConfig& config)
  : BlobClient(open_backend(config), config.chunk_size) {}

BlobClient::BlobClient(std::shared_ptr<store::BucketBackend> backend, uint32_t chunk_size)
  : backend_(backend)
  , streamer_(std::move(backend), chunk_size) {
  BOOST_LOG_TRIVIAL(info) << "Blob client: Initialized with chunk size " << chunk_size;
}

std::shared_ptr<store::BucketBackend> BlobClient::open_backend(const config::BucketConfig& config) {
  config.validate();
  return std::make_shared<store::FileBucket>(config.root_path(), config.database, config.bucket);
}


//==============================================
// LOOKUP
//==============================================

types::ObjectId BlobClient::id(const std::string& name) const {
  return index().resolve(name);
}

bool BlobClient::exists(const std::string& name) const {
  return index().exists(name);
}

types::ObjectRecord BlobClient::describe(const types::ObjectId& id) const {
  return index().describe(id);
}


//==============================================
// READ OPERATIONS
//==============================================

types::Bytes BlobClient::read_bytes(const std::string& name) const {
  BOOST_LOG_TRIVIAL(debug) << "Blob client: Reading bytes of: " << name;
  return read_bytes(id(name));
}

types::Bytes BlobClient::read_bytes(const types::ObjectId& id) const {
  auto reader = open_read(id);

  types::Bytes content;
  content.reserve(reader->record().length);
  while (auto chunk = reader->next()) {
    content.insert(content.end(), chunk->begin(), chunk->end());
  }

  BOOST_LOG_TRIVIAL(info) << "Blob client: Read " << content.size() << " bytes from " << id;
  return content;
}

std::string BlobClient::read_text(const std::string& name) const {
  return read_text(id(name));
}

std::string BlobClient::read_text(const types::ObjectId& id) const {
  return decode_text(read_bytes(id), id);
}

uint64_t BlobClient::download_to_stream(const types::ObjectId& id, std::ostream& output) const {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Blob client: Invalid output stream for " << id;
    throw LocalIOError("Invalid output stream for " + id.to_hex());
  }

  auto reader = open_read(id);
  uint64_t total_bytes = 0;

  while (auto chunk = reader->next()) {
    output.write(reinterpret_cast<const char*>(chunk->data()),
                 static_cast<std::streamsize>(chunk->size()));
    if (!output) {
      BOOST_LOG_TRIVIAL(error) << "Blob client: Failed writing " << id << " after "
                               << total_bytes << " bytes";
      throw LocalIOError("Failed to write content of " + id.to_hex());
    }
    total_bytes += chunk->size();
  }

  output.flush();
  if (!output) {
    throw LocalIOError("Failed to flush content of " + id.to_hex());
  }

  BOOST_LOG_TRIVIAL(info) << "Blob client: Streamed " << total_bytes << " bytes from " << id;
  return total_bytes;
}


//==============================================
// WRITE OPERATIONS
//==============================================

types::ObjectId BlobClient::write_bytes(const std::string& name, const types::Bytes& data) {
  BOOST_LOG_TRIVIAL(debug) << "Blob client: Writing " << data.size() << " bytes as: " << name;
  auto writer = open_write(name);
  writer->write(data);
  return writer->close();
}

types::ObjectId BlobClient::write_text(const std::string& name, const std::string& text) {
  auto writer = open_write(name);
  writer->write(reinterpret_cast<const uint8_t*>(text.data()), text.size());
  return writer->close();
}

types::ObjectId BlobClient::upload_from_stream(const std::string& name, std::istream& input) {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Blob client: Invalid input stream for: " << name;
    throw LocalIOError("Invalid input stream for '" + name + "'");
  }

  auto writer = open_write(name);
  std::vector<char> buffer(chunk_size());

  while (true) {
    input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize got = input.gcount();
    if (got > 0) {
      writer->write(reinterpret_cast<const uint8_t*>(buffer.data()), static_cast<size_t>(got));
    }

    if (input.bad() || (input.fail() && !input.eof())) {
      BOOST_LOG_TRIVIAL(error) << "Blob client: Input failed after " << writer->bytes_written()
                               << " bytes while uploading: " << name;
      writer->abort();
      throw LocalIOError("Failed to read input while uploading '" + name + "'");
    }
    if (!input) {
      break;
    }
  }

  return writer->close();
}


//==============================================
// STREAMS
//==============================================

std::unique_ptr<stream::ChunkReader> BlobClient::open_read(const types::ObjectId& id) const {
  return streamer_.open_read(id);
}

std::unique_ptr<stream::ChunkWriter> BlobClient::open_write(const std::string& name) const {
  return streamer_.open_write(name);
}


//==============================================
// TEXT SUPPORT
//==============================================

std::string BlobClient::decode_text(const types::Bytes& data, const types::ObjectId& id) {
  if (data.empty()) {
    return std::string();
  }

  const char* begin = reinterpret_cast<const char*>(data.data());
  try {
    return boost::locale::conv::utf_to_utf<char>(begin, begin + data.size(),
                                                 boost::locale::conv::stop);
  } catch (const boost::locale::conv::conversion_error&) {
    BOOST_LOG_TRIVIAL(error) << "Blob client: Content of " << id << " is not valid UTF-8";
    throw DecodeError("Content of " + id.to_hex() + " is not valid UTF-8");
  }
}

} // namespace client
} // namespace gridsync
