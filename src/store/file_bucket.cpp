#include "store/file_bucket.hpp"
#include "store/record_codec.hpp"
#include "crypto/digest.hpp"
#include "error/blob_error.hpp"
#include <boost/log/trivial.hpp>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace gridsync {
namespace store {

namespace {

constexpr const char* RECORD_EXTENSION = ".rec";
constexpr const char* CHUNK_EXTENSION = ".chunk";

std::string temp_suffix() {
  auto bytes = crypto::random_bytes(8);
  std::stringstream ss;
  ss << ".tmp-";
  for (uint8_t b : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  }
  return ss.str();
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileBucket::FileBucket(const std::filesystem::path& root, const std::string& database,
                       const std::string& bucket)
  : files_dir_(root / database / (bucket + ".files"))
  , chunks_dir_(root / database / (bucket + ".chunks")) {
  BOOST_LOG_TRIVIAL(info) << "File bucket: Initializing bucket '" << bucket
                          << "' in database '" << database << "' at: " << root.string();
  check_directory_exists(files_dir_);
  check_directory_exists(chunks_dir_);
  BOOST_LOG_TRIVIAL(debug) << "File bucket: Bucket directories created/verified";
}


//==============================================
// CHUNK OPERATIONS
//==============================================

void FileBucket::insert_chunk(const types::ObjectId& id, uint32_t n, const types::Bytes& data) {
  std::filesystem::path chunk_path = get_chunk_path(id, n);
  check_directory_exists(chunk_path.parent_path());

  write_atomically(chunk_path, [&data](std::ofstream& file) {
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
  });

  BOOST_LOG_TRIVIAL(debug) << "File bucket: Stored chunk " << n << " of " << id
                           << " (" << data.size() << " bytes)";
}

std::optional<types::Bytes> FileBucket::find_chunk(const types::ObjectId& id, uint32_t n) {
  std::filesystem::path chunk_path = get_chunk_path(id, n);

  std::ifstream file(chunk_path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(debug) << "File bucket: Chunk " << n << " of " << id << " not found";
    return std::nullopt;
  }

  types::Bytes data;
  char buffer[4096];

  // Read file in blocks to handle chunks of any size
  while (file.read(buffer, sizeof(buffer))) {
    data.insert(data.end(), buffer, buffer + file.gcount());
  }

  // Handle final partial block if present
  if (file.gcount() > 0) {
    data.insert(data.end(), buffer, buffer + file.gcount());
  }

  if (file.bad()) {
    BOOST_LOG_TRIVIAL(error) << "File bucket: Failed to read chunk file: " << chunk_path.string();
    throw RemoteError("File bucket: Failed to read chunk " + std::to_string(n) + " of " + id.to_hex());
  }

  return data;
}

void FileBucket::delete_chunks(const types::ObjectId& id) {
  BOOST_LOG_TRIVIAL(debug) << "File bucket: Deleting chunks of " << id;

  std::error_code ec;
  std::filesystem::remove_all(get_chunk_dir(id), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "File bucket: Failed to delete chunks of " << id << ": " << ec.message();
    throw RemoteError("File bucket: Failed to delete chunks of " + id.to_hex() + ": " + ec.message());
  }
}


//==============================================
// RECORD OPERATIONS
//==============================================

void FileBucket::insert_record(const types::ObjectRecord& record) {
  BOOST_LOG_TRIVIAL(info) << "File bucket: Publishing record " << record.id
                          << " for name: " << record.name;

  write_atomically(get_record_path(record.id), [&record](std::ofstream& file) {
    RecordCodec::serialize(record, file);
  });
}

std::vector<types::ObjectRecord> FileBucket::find_records(const types::RecordFilter& filter) {
  std::vector<types::ObjectRecord> records;

  // Direct lookup when the identifier is known
  if (filter.id) {
    auto record = read_record(get_record_path(*filter.id));
    if (record && filter.matches(*record)) {
      records.push_back(std::move(*record));
    }
    return records;
  }

  std::error_code ec;
  std::filesystem::directory_iterator it(files_dir_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "File bucket: Failed to list records: " << ec.message();
    throw RemoteError("File bucket: Failed to list records: " + ec.message());
  }

  for (const auto& entry : it) {
    if (entry.path().extension() != RECORD_EXTENSION) {
      continue;  // in-flight temporary files
    }
    auto record = read_record(entry.path());
    if (record && filter.matches(*record)) {
      records.push_back(std::move(*record));
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "File bucket: Found " << records.size() << " matching records";
  return records;
}

bool FileBucket::delete_record(const types::ObjectId& id) {
  std::error_code ec;
  bool removed = std::filesystem::remove(get_record_path(id), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "File bucket: Failed to delete record " << id << ": " << ec.message();
    throw RemoteError("File bucket: Failed to delete record " + id.to_hex() + ": " + ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "File bucket: Record " << id << (removed ? " deleted" : " not found");
  return removed;
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::size_t FileBucket::count_chunks(const types::ObjectId& id) const {
  std::filesystem::path chunk_dir = get_chunk_dir(id);
  if (!std::filesystem::exists(chunk_dir)) {
    return 0;
  }

  std::size_t count = 0;
  for (const auto& entry : std::filesystem::directory_iterator(chunk_dir)) {
    if (entry.path().extension() == CHUNK_EXTENSION) {
      ++count;
    }
  }
  return count;
}

void FileBucket::clear() {
  BOOST_LOG_TRIVIAL(info) << "File bucket: Clearing bucket at: " << files_dir_.parent_path().string();
  std::filesystem::remove_all(files_dir_);
  std::filesystem::remove_all(chunks_dir_);
  check_directory_exists(files_dir_);
  check_directory_exists(chunks_dir_);
  BOOST_LOG_TRIVIAL(info) << "File bucket: Bucket cleared successfully";
}


//==============================================
// PATH SUPPORT
//==============================================

std::filesystem::path FileBucket::get_chunk_dir(const types::ObjectId& id) const {
  std::string hash = crypto::Sha256::hex_digest(id.to_hex());
  std::filesystem::path path = chunks_dir_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}

std::filesystem::path FileBucket::get_chunk_path(const types::ObjectId& id, uint32_t n) const {
  std::stringstream name;
  name << std::setw(8) << std::setfill('0') << n << CHUNK_EXTENSION;
  return get_chunk_dir(id) / name.str();
}

std::filesystem::path FileBucket::get_record_path(const types::ObjectId& id) const {
  return files_dir_ / (id.to_hex() + RECORD_EXTENSION);
}


//==============================================
// FILE SUPPORT
//==============================================

void FileBucket::check_directory_exists(const std::filesystem::path& path) const {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "File bucket: Failed to create directory " << path.string()
                             << ": " << ec.message();
    throw RemoteError("File bucket: Failed to create directory " + path.string());
  }
}

void FileBucket::write_atomically(const std::filesystem::path& target,
                                  const std::function<void(std::ofstream&)>& writer) const {
  std::filesystem::path temp_path = target;
  temp_path += temp_suffix();

  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "File bucket: Failed to create file: " << temp_path.string();
      throw RemoteError("File bucket: Failed to create file: " + temp_path.string());
    }

    try {
      writer(file);
      file.close();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "File bucket: Write failed for " << target.string() << ": " << e.what();
      file.close();
      std::error_code ignored;
      std::filesystem::remove(temp_path, ignored);
      throw;
    }

    if (!file) {
      std::error_code ignored;
      std::filesystem::remove(temp_path, ignored);
      throw RemoteError("File bucket: Failed to write file: " + target.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, target, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "File bucket: Failed to publish " << target.string() << ": " << ec.message();
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw RemoteError("File bucket: Failed to publish " + target.string() + ": " + ec.message());
  }
}

std::optional<types::ObjectRecord> FileBucket::read_record(const std::filesystem::path& path) const {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    // Absent, or deleted while listing
    return std::nullopt;
  }
  return RecordCodec::deserialize(file);
}

} // namespace store
} // namespace gridsync
