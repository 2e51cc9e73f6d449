#include "stream/chunk_stream.hpp"
#include "error/blob_error.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace gridsync {
namespace stream {

//==============================================
// CHUNK READER
//==============================================

ChunkReader::ChunkReader(std::shared_ptr<store::BucketBackend> backend, types::ObjectRecord record)
  : backend_(std::move(backend))
  , record_(std::move(record)) {
  BOOST_LOG_TRIVIAL(debug) << "Chunk reader: Opened " << record_.id << " ("
                           << record_.length << " bytes in " << record_.chunk_count << " chunks)";
}

std::optional<types::Bytes> ChunkReader::next() {
  if (next_chunk_ >= record_.chunk_count) {
    if (!verified_) {
      verify_checksum();
    }
    return std::nullopt;
  }

  uint32_t n = next_chunk_;
  auto chunk = backend_->find_chunk(record_.id, n);
  if (!chunk) {
    BOOST_LOG_TRIVIAL(error) << "Chunk reader: Chunk " << n << " of " << record_.id << " is missing";
    throw RemoteError("Chunk " + std::to_string(n) + " of " + record_.id.to_hex() + " is missing");
  }

  uint64_t expected = expected_chunk_size(n);
  if (chunk->size() != expected) {
    BOOST_LOG_TRIVIAL(error) << "Chunk reader: Chunk " << n << " of " << record_.id << " has "
                             << chunk->size() << " bytes, expected " << expected;
    throw RemoteError("Chunk " + std::to_string(n) + " of " + record_.id.to_hex() + " has wrong size");
  }

  digest_.update(chunk->data(), chunk->size());
  bytes_read_ += chunk->size();
  ++next_chunk_;
  return chunk;
}

uint64_t ChunkReader::expected_chunk_size(uint32_t n) const {
  if (n + 1 < record_.chunk_count) {
    return record_.chunk_size;
  }
  return record_.length - static_cast<uint64_t>(record_.chunk_size) * n;
}

void ChunkReader::verify_checksum() {
  std::string actual = digest_.finalize_hex();
  if (bytes_read_ != record_.length || actual != record_.checksum) {
    BOOST_LOG_TRIVIAL(error) << "Chunk reader: Content of " << record_.id
                             << " does not match its record (checksum " << actual
                             << ", expected " << record_.checksum << ")";
    throw RemoteError("Content of " + record_.id.to_hex() + " failed checksum verification");
  }
  verified_ = true;
  BOOST_LOG_TRIVIAL(debug) << "Chunk reader: Finished " << record_.id << ", " << bytes_read_ << " bytes verified";
}


//==============================================
// CHUNK WRITER
//==============================================

ChunkWriter::ChunkWriter(std::shared_ptr<store::BucketBackend> backend, metadata::MetadataIndex index,
                         std::string name, types::ObjectId id, uint32_t chunk_size)
  : backend_(std::move(backend))
  , index_(std::move(index))
  , name_(std::move(name))
  , id_(id)
  , chunk_size_(chunk_size) {
  buffer_.reserve(chunk_size_);
  BOOST_LOG_TRIVIAL(debug) << "Chunk writer: Opened " << id_ << " for name: " << name_;
}

ChunkWriter::~ChunkWriter() {
  if (state_ == State::Open) {
    BOOST_LOG_TRIVIAL(warning) << "Chunk writer: " << id_ << " destroyed before close, aborting upload of "
                               << name_;
    abort();
  }
}

void ChunkWriter::write(const uint8_t* data, size_t size) {
  ensure_open();

  // Chunk numbers are 32-bit, which caps the object size
  uint64_t capacity = static_cast<uint64_t>(chunk_size_) * std::numeric_limits<uint32_t>::max();
  uint64_t pending = bytes_written_ + buffer_.size();
  if (size > capacity - pending) {
    BOOST_LOG_TRIVIAL(error) << "Chunk writer: " << name_ << " would exceed "
                             << std::numeric_limits<uint32_t>::max() << " chunks of " << chunk_size_ << " bytes";
    state_ = State::Failed;
    buffer_.clear();
    discard_chunks();
    throw RemoteError("Object '" + name_ + "' exceeds the maximum chunk count");
  }

  size_t offset = 0;
  while (offset < size) {
    size_t space = chunk_size_ - buffer_.size();
    size_t take = std::min(space, size - offset);
    buffer_.insert(buffer_.end(), data + offset, data + offset + take);
    offset += take;

    if (buffer_.size() == chunk_size_) {
      flush_chunk();
    }
  }
}

types::ObjectId ChunkWriter::close() {
  ensure_open();

  if (!buffer_.empty()) {
    flush_chunk();
  }

  types::ObjectRecord record;
  record.id = id_;
  record.name = name_;
  record.length = bytes_written_;
  record.chunk_size = chunk_size_;
  record.chunk_count = chunks_written_;
  record.checksum = digest_.finalize_hex();
  record.upload_date = metadata::MetadataIndex::next_upload_date();

  try {
    index_.publish(record);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk writer: Failed to publish " << id_ << ": " << e.what();
    state_ = State::Failed;
    discard_chunks();
    throw;
  }

  state_ = State::Closed;
  BOOST_LOG_TRIVIAL(info) << "Chunk writer: Uploaded " << bytes_written_ << " bytes as " << id_
                          << " for name: " << name_;
  return id_;
}

void ChunkWriter::abort() {
  if (state_ != State::Open) {
    return;
  }
  BOOST_LOG_TRIVIAL(info) << "Chunk writer: Aborting upload of " << name_ << " (" << id_ << ")";
  state_ = State::Aborted;
  buffer_.clear();
  discard_chunks();
}

void ChunkWriter::ensure_open() const {
  if (state_ != State::Open) {
    throw std::logic_error("Chunk writer: Stream for '" + name_ + "' is no longer open");
  }
}

void ChunkWriter::flush_chunk() {
  if (chunks_written_ == std::numeric_limits<uint32_t>::max()) {
    state_ = State::Failed;
    buffer_.clear();
    discard_chunks();
    throw RemoteError("Object '" + name_ + "' exceeds the maximum chunk count");
  }

  try {
    backend_->insert_chunk(id_, chunks_written_, buffer_);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk writer: Failed to store chunk " << chunks_written_ << " of "
                             << id_ << ": " << e.what();
    state_ = State::Failed;
    buffer_.clear();
    discard_chunks();
    throw;
  }

  digest_.update(buffer_.data(), buffer_.size());
  bytes_written_ += buffer_.size();
  ++chunks_written_;
  buffer_.clear();
}

void ChunkWriter::discard_chunks() {
  try {
    backend_->delete_chunks(id_);
    BOOST_LOG_TRIVIAL(debug) << "Chunk writer: Discarded chunks of " << id_;
  } catch (const std::exception& e) {
    // Leftover chunks are unreferenced and reclaimable
    BOOST_LOG_TRIVIAL(warning) << "Chunk writer: Could not discard chunks of " << id_ << ": " << e.what();
  }
}


//==============================================
// CHUNK STREAMER
//==============================================

ChunkStreamer::ChunkStreamer(std::shared_ptr<store::BucketBackend> backend, uint32_t chunk_size)
  : backend_(backend)
  , index_(backend)
  , chunk_size_(chunk_size) {
  if (chunk_size_ == 0) {
    throw std::invalid_argument("Chunk streamer: Chunk size must be positive");
  }
}

std::unique_ptr<ChunkReader> ChunkStreamer::open_read(const types::ObjectId& id) const {
  types::ObjectRecord record = index_.describe(id);
  return std::make_unique<ChunkReader>(backend_, std::move(record));
}

std::unique_ptr<ChunkWriter> ChunkStreamer::open_write(const std::string& name) const {
  return std::make_unique<ChunkWriter>(backend_, index_, name, index_.assign_id(), chunk_size_);
}

} // namespace stream
} // namespace gridsync
