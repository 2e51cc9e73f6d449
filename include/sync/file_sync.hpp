#ifndef GRIDSYNC_SYNC_FILE_SYNC_HPP
#define GRIDSYNC_SYNC_FILE_SYNC_HPP

#include <filesystem>
#include <string>
#include "client/blob_client.hpp"

namespace gridsync {
namespace sync {

// Moves objects between a bucket and local files without holding whole
// objects in memory.
class FileSync {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileSync(client::BlobClient& client);


  // ---- TRANSFERS ----
  // Streams the newest object named name into local_path, creating or
  // truncating it. If anything fails after the file was created the partial
  // file is removed before the error propagates.
  types::ObjectId download_to(const std::string& name, const std::filesystem::path& local_path) const;
  // Streams local_path into a new object named name. Local read failures
  // raise LocalIOError and publish nothing.
  types::ObjectId upload_from(const std::string& name, const std::filesystem::path& local_path);

private:
  client::BlobClient& client_;
};

} // namespace sync
} // namespace gridsync

#endif // GRIDSYNC_SYNC_FILE_SYNC_HPP
