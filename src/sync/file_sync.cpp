#include "sync/file_sync.hpp"
#include "error/blob_error.hpp"
#include <fstream>
#include <system_error>
#include <boost/log/trivial.hpp>

namespace gridsync {
namespace sync {

namespace {

// Closes and removes a partially written download unless commit() was
// reached. The stream is closed first so the removal also succeeds where
// open files cannot be deleted.
class PartialFileGuard {
public:
  PartialFileGuard(std::ofstream& file, std::filesystem::path path)
    : file_(file)
    , path_(std::move(path)) {}

  ~PartialFileGuard() {
    if (committed_) {
      return;
    }
    if (file_.is_open()) {
      file_.close();
    }
    std::error_code ec;
    if (std::filesystem::remove(path_, ec)) {
      BOOST_LOG_TRIVIAL(info) << "File sync: Removed partial download: " << path_.string();
    } else if (ec) {
      BOOST_LOG_TRIVIAL(error) << "File sync: Could not remove partial download "
                               << path_.string() << ": " << ec.message();
    }
  }

  PartialFileGuard(const PartialFileGuard&) = delete;
  PartialFileGuard& operator=(const PartialFileGuard&) = delete;

  void commit() { committed_ = true; }

private:
  std::ofstream& file_;
  std::filesystem::path path_;
  bool committed_{false};
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileSync::FileSync(client::BlobClient& client) : client_(client) {}


//==============================================
// TRANSFERS
//==============================================

types::ObjectId FileSync::download_to(const std::string& name,
                                      const std::filesystem::path& local_path) const {
  BOOST_LOG_TRIVIAL(info) << "File sync: Downloading " << name << " to " << local_path.string();

  // Resolve before touching the filesystem so a missing name leaves no file
  types::ObjectId id = client_.id(name);
  auto reader = client_.open_read(id);

  std::ofstream file(local_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "File sync: Failed to create file: " << local_path.string();
    throw LocalIOError("Failed to create file: " + local_path.string());
  }
  PartialFileGuard guard(file, local_path);

  uint64_t total_bytes = 0;
  while (auto chunk = reader->next()) {
    file.write(reinterpret_cast<const char*>(chunk->data()),
               static_cast<std::streamsize>(chunk->size()));
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "File sync: Write failed for " << local_path.string()
                               << " after " << total_bytes << " bytes";
      throw LocalIOError("Failed to write file: " + local_path.string());
    }
    total_bytes += chunk->size();
  }

  file.close();
  if (!file) {
    throw LocalIOError("Failed to close file: " + local_path.string());
  }

  guard.commit();
  BOOST_LOG_TRIVIAL(info) << "File sync: Downloaded " << total_bytes << " bytes of " << name
                          << " (" << id << ")";
  return id;
}

types::ObjectId FileSync::upload_from(const std::string& name,
                                      const std::filesystem::path& local_path) {
  BOOST_LOG_TRIVIAL(info) << "File sync: Uploading " << local_path.string() << " as " << name;

  std::error_code ec;
  if (std::filesystem::is_directory(local_path, ec)) {
    throw LocalIOError("Path is a directory: " + local_path.string());
  }

  std::ifstream file(local_path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "File sync: Failed to open file: " << local_path.string();
    throw LocalIOError("Failed to open file: " + local_path.string());
  }

  types::ObjectId id = client_.upload_from_stream(name, file);
  BOOST_LOG_TRIVIAL(info) << "File sync: Uploaded " << local_path.string() << " as " << id;
  return id;
}

} // namespace sync
} // namespace gridsync
