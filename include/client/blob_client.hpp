#ifndef GRIDSYNC_CLIENT_BLOB_CLIENT_HPP
#define GRIDSYNC_CLIENT_BLOB_CLIENT_HPP

#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include "config/config.hpp"
#include "metadata/metadata_index.hpp"
#include "store/bucket_backend.hpp"
#include "stream/chunk_stream.hpp"

namespace gridsync {
namespace client {

// Name- and identifier-keyed access to a bucket. Holds the backend by shared
// ownership; clients sharing a backend see each other's writes immediately
// since nothing is cached here.
class BlobClient {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Opens the filesystem bucket named by a validated configuration
  explicit BlobClient(const config::BucketConfig& config);
  explicit BlobClient(std::shared_ptr<store::BucketBackend> backend,
                      uint32_t chunk_size = config::BucketConfig::DEFAULT_CHUNK_SIZE);


  // ---- LOOKUP ----
  types::ObjectId id(const std::string& name) const;
  bool exists(const std::string& name) const;
  types::ObjectRecord describe(const types::ObjectId& id) const;


  // ---- READ OPERATIONS ----
  types::Bytes read_bytes(const std::string& name) const;
  types::Bytes read_bytes(const types::ObjectId& id) const;
  // Throws DecodeError when the content is not valid UTF-8
  std::string read_text(const std::string& name) const;
  std::string read_text(const types::ObjectId& id) const;
  // Streams the object into output and returns the byte count
  uint64_t download_to_stream(const types::ObjectId& id, std::ostream& output) const;


  // ---- WRITE OPERATIONS ----
  types::ObjectId write_bytes(const std::string& name, const types::Bytes& data);
  types::ObjectId write_text(const std::string& name, const std::string& text);
  // Uploads everything left in input; a failing input aborts the upload
  // and raises LocalIOError
  types::ObjectId upload_from_stream(const std::string& name, std::istream& input);


  // ---- STREAMS ----
  std::unique_ptr<stream::ChunkReader> open_read(const types::ObjectId& id) const;
  std::unique_ptr<stream::ChunkWriter> open_write(const std::string& name) const;


  // ---- GETTERS ----
  const metadata::MetadataIndex& index() const { return streamer_.index(); }
  const std::shared_ptr<store::BucketBackend>& backend() const { return backend_; }
  uint32_t chunk_size() const { return streamer_.chunk_size(); }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<store::BucketBackend> backend_;
  stream::ChunkStreamer streamer_;

  static std::shared_ptr<store::BucketBackend> open_backend(const config::BucketConfig& config);
  static std::string decode_text(const types::Bytes& data, const types::ObjectId& id);
};

} // namespace client
} // namespace gridsync

#endif // GRIDSYNC_CLIENT_BLOB_CLIENT_HPP
