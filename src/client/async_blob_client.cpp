#include "client/async_blob_client.hpp"
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace gridsync {
namespace client {

namespace {

std::size_t require_workers(std::size_t worker_threads) {
  if (worker_threads == 0) {
    throw std::invalid_argument("Async blob client: At least one worker thread is required");
  }
  return worker_threads;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

AsyncBlobClient::AsyncBlobClient(const config::BucketConfig& config)
  : client_(config)
  , sync_(client_)
  , pool_(require_workers(config.worker_threads)) {
  BOOST_LOG_TRIVIAL(info) << "Async blob client: Started " << config.worker_threads << " workers";
}

AsyncBlobClient::AsyncBlobClient(std::shared_ptr<store::BucketBackend> backend, uint32_t chunk_size,
                                 std::size_t worker_threads)
  : client_(std::move(backend), chunk_size)
  , sync_(client_)
  , pool_(require_workers(worker_threads)) {
  BOOST_LOG_TRIVIAL(info) << "Async blob client: Started " << worker_threads << " workers";
}

AsyncBlobClient::~AsyncBlobClient() {
  BOOST_LOG_TRIVIAL(debug) << "Async blob client: Waiting for outstanding operations";
  pool_.join();
}


//==============================================
// ASYNC OPERATIONS
//==============================================

std::future<types::Bytes> AsyncBlobClient::read_bytes_async(const std::string& name) {
  return submit([this, name]() { return client_.read_bytes(name); });
}

std::future<std::string> AsyncBlobClient::read_text_async(const std::string& name) {
  return submit([this, name]() { return client_.read_text(name); });
}

std::future<types::ObjectId> AsyncBlobClient::write_bytes_async(const std::string& name, types::Bytes data) {
  return submit([this, name, data = std::move(data)]() { return client_.write_bytes(name, data); });
}

std::future<bool> AsyncBlobClient::exists_async(const std::string& name) {
  return submit([this, name]() { return client_.exists(name); });
}

std::future<types::ObjectId> AsyncBlobClient::download_to_async(const std::string& name,
                                                                std::filesystem::path local_path) {
  return submit([this, name, local_path = std::move(local_path)]() {
    return sync_.download_to(name, local_path);
  });
}

std::future<types::ObjectId> AsyncBlobClient::upload_from_async(const std::string& name,
                                                                std::filesystem::path local_path) {
  return submit([this, name, local_path = std::move(local_path)]() {
    return sync_.upload_from(name, local_path);
  });
}

} // namespace client
} // namespace gridsync
