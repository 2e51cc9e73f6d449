#ifndef GRIDSYNC_STORE_FILE_BUCKET_HPP
#define GRIDSYNC_STORE_FILE_BUCKET_HPP

#include <filesystem>
#include <functional>
#include <fstream>
#include <string>
#include "store/bucket_backend.hpp"

namespace gridsync {
namespace store {

// Bucket backend on the local filesystem, laid out like a GridFS bucket:
//   {root}/{database}/{bucket}.files/{id}.rec
//   {root}/{database}/{bucket}.chunks/{h[0:2]}/{h[2:4]}/{h[4:6]}/{rest}/{n}.chunk
// where h is the SHA-256 of the identifier's hex form. Every file is written
// to a temporary sibling and renamed into place.
class FileBucket : public BucketBackend {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  FileBucket(const std::filesystem::path& root, const std::string& database,
             const std::string& bucket);
  ~FileBucket() override = default;


  // ---- CHUNK OPERATIONS ----
  void insert_chunk(const types::ObjectId& id, uint32_t n, const types::Bytes& data) override;
  std::optional<types::Bytes> find_chunk(const types::ObjectId& id, uint32_t n) override;
  void delete_chunks(const types::ObjectId& id) override;


  // ---- RECORD OPERATIONS ----
  void insert_record(const types::ObjectRecord& record) override;
  std::vector<types::ObjectRecord> find_records(const types::RecordFilter& filter) override;
  bool delete_record(const types::ObjectId& id) override;


  // ---- QUERY OPERATIONS ----
  // Number of chunk files currently stored for an identifier
  std::size_t count_chunks(const types::ObjectId& id) const;
  // Removes every record and chunk of the bucket
  void clear();

  const std::filesystem::path& files_dir() const { return files_dir_; }
  const std::filesystem::path& chunks_dir() const { return chunks_dir_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path files_dir_;
  std::filesystem::path chunks_dir_;


  // ---- PATH SUPPORT ----
  // {chunks_dir}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
  std::filesystem::path get_chunk_dir(const types::ObjectId& id) const;
  std::filesystem::path get_chunk_path(const types::ObjectId& id, uint32_t n) const;
  std::filesystem::path get_record_path(const types::ObjectId& id) const;


  // ---- FILE SUPPORT ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Writes through a temporary sibling, then renames onto the target
  void write_atomically(const std::filesystem::path& target,
                        const std::function<void(std::ofstream&)>& writer) const;
  std::optional<types::ObjectRecord> read_record(const std::filesystem::path& path) const;
};

} // namespace store
} // namespace gridsync

#endif // GRIDSYNC_STORE_FILE_BUCKET_HPP
