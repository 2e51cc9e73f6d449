#ifndef GRIDSYNC_STREAM_CHUNK_STREAM_HPP
#define GRIDSYNC_STREAM_CHUNK_STREAM_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "crypto/digest.hpp"
#include "metadata/metadata_index.hpp"
#include "store/bucket_backend.hpp"

namespace gridsync {
namespace stream {

// Lazy, finite, non-restartable sequence of an object's chunks in stored
// order. Verifies chunk sizes as they arrive and the content checksum once
// the last chunk has been handed out.
class ChunkReader {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ChunkReader(std::shared_ptr<store::BucketBackend> backend, types::ObjectRecord record);

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;


  // ---- STREAM OPERATIONS ----
  // Returns the next chunk, or nullopt once the object is exhausted.
  // Throws RemoteError on a missing or mis-sized chunk or checksum mismatch.
  std::optional<types::Bytes> next();


  // ---- GETTERS ----
  const types::ObjectRecord& record() const { return record_; }
  uint64_t bytes_read() const { return bytes_read_; }
  bool done() const { return verified_; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<store::BucketBackend> backend_;
  types::ObjectRecord record_;
  crypto::Sha256 digest_;
  uint32_t next_chunk_{0};
  uint64_t bytes_read_{0};
  bool verified_{false};

  uint64_t expected_chunk_size(uint32_t n) const;
  void verify_checksum();
};


// Sink for a new object. Bytes are buffered and flushed one full chunk at a
// time; close() flushes the tail and publishes the record. Until close()
// succeeds no record exists, and a writer that is aborted, fails, or is
// destroyed while open deletes the chunks it wrote.
class ChunkWriter {
public:
  enum class State {
    Open,
    Closed,
    Aborted,
    Failed
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ChunkWriter(std::shared_ptr<store::BucketBackend> backend, metadata::MetadataIndex index,
              std::string name, types::ObjectId id, uint32_t chunk_size);
  ~ChunkWriter();

  ChunkWriter(const ChunkWriter&) = delete;
  ChunkWriter& operator=(const ChunkWriter&) = delete;


  // ---- STREAM OPERATIONS ----
  void write(const uint8_t* data, size_t size);
  void write(const types::Bytes& data) { write(data.data(), data.size()); }
  // Publishes the record and returns its identifier
  types::ObjectId close();
  // Discards everything written so far
  void abort();


  // ---- GETTERS ----
  const types::ObjectId& id() const { return id_; }
  const std::string& name() const { return name_; }
  uint64_t bytes_written() const { return bytes_written_; }
  State state() const { return state_; }

private:
  // ---- PARAMETERS ----
  std::shared_ptr<store::BucketBackend> backend_;
  metadata::MetadataIndex index_;
  std::string name_;
  types::ObjectId id_;
  uint32_t chunk_size_;
  types::Bytes buffer_;
  crypto::Sha256 digest_;
  uint32_t chunks_written_{0};
  uint64_t bytes_written_{0};
  State state_{State::Open};

  void ensure_open() const;
  void flush_chunk();
  // Best-effort removal of written chunks
  void discard_chunks();
};


// Opens chunk streams over a bucket backend
class ChunkStreamer {
public:
  static constexpr uint32_t DEFAULT_CHUNK_SIZE = 255 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ChunkStreamer(std::shared_ptr<store::BucketBackend> backend,
                         uint32_t chunk_size = DEFAULT_CHUNK_SIZE);


  // ---- STREAM FACTORIES ----
  // Throws NotFoundError when the identifier has no record
  std::unique_ptr<ChunkReader> open_read(const types::ObjectId& id) const;
  std::unique_ptr<ChunkWriter> open_write(const std::string& name) const;


  // ---- GETTERS ----
  const metadata::MetadataIndex& index() const { return index_; }
  uint32_t chunk_size() const { return chunk_size_; }

private:
  std::shared_ptr<store::BucketBackend> backend_;
  metadata::MetadataIndex index_;
  uint32_t chunk_size_;
};

} // namespace stream
} // namespace gridsync

#endif // GRIDSYNC_STREAM_CHUNK_STREAM_HPP
