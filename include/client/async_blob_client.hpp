#pragma once

#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include "client/blob_client.hpp"
#include "sync/file_sync.hpp"

namespace gridsync {
namespace client {

// Runs blob operations on a worker pool so callers waiting on store I/O do
// not block each other. Errors travel through the returned futures.
class AsyncBlobClient {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit AsyncBlobClient(const config::BucketConfig& config);
  AsyncBlobClient(std::shared_ptr<store::BucketBackend> backend, uint32_t chunk_size,
                  std::size_t worker_threads);
  // Waits for queued operations to finish
  ~AsyncBlobClient();

  AsyncBlobClient(const AsyncBlobClient&) = delete;
  AsyncBlobClient& operator=(const AsyncBlobClient&) = delete;


  // ---- ASYNC OPERATIONS ----
  std::future<types::Bytes> read_bytes_async(const std::string& name);
  std::future<std::string> read_text_async(const std::string& name);
  std::future<types::ObjectId> write_bytes_async(const std::string& name, types::Bytes data);
  std::future<bool> exists_async(const std::string& name);
  std::future<types::ObjectId> download_to_async(const std::string& name, std::filesystem::path local_path);
  std::future<types::ObjectId> upload_from_async(const std::string& name, std::filesystem::path local_path);


  // ---- GETTERS ----
  BlobClient& client() { return client_; }

private:
  // ---- PARAMETERS ----
  BlobClient client_;
  sync::FileSync sync_;
  boost::asio::thread_pool pool_;

  // Queues fn on the pool and hands back its result
  template <typename Fn>
  auto submit(Fn fn) -> std::future<decltype(fn())> {
    using result_type = decltype(fn());
    auto task = std::make_shared<std::packaged_task<result_type()>>(std::move(fn));
    auto future = task->get_future();
    boost::asio::post(pool_, [task]() { (*task)(); });
    return future;
  }
};

} // namespace client
} // namespace gridsync
