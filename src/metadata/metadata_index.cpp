#include "metadata/metadata_index.hpp"
#include "error/blob_error.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace gridsync {
namespace metadata {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

MetadataIndex::MetadataIndex(std::shared_ptr<store::BucketBackend> backend)
  : backend_(std::move(backend)) {
  if (!backend_) {
    throw std::invalid_argument("Metadata index: Backend must not be null");
  }
}


//==============================================
// LOOKUP OPERATIONS
//==============================================

types::ObjectId MetadataIndex::resolve(const std::string& name) const {
  BOOST_LOG_TRIVIAL(debug) << "Metadata index: Resolving name: " << name;

  auto records = backend_->find_records(types::RecordFilter::by_name(name));
  if (records.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "Metadata index: No record for name: " << name;
    throw NotFoundError("No object named '" + name + "'");
  }

  auto newest = std::max_element(records.begin(), records.end(),
    [](const types::ObjectRecord& a, const types::ObjectRecord& b) {
      return newer_than(b, a);
    });

  if (records.size() > 1) {
    BOOST_LOG_TRIVIAL(debug) << "Metadata index: " << records.size() << " records share name "
                             << name << ", resolved to newest " << newest->id;
  }
  return newest->id;
}

types::ObjectRecord MetadataIndex::describe(const types::ObjectId& id) const {
  auto records = backend_->find_records(types::RecordFilter::by_id(id));
  if (records.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "Metadata index: Unknown identifier: " << id;
    throw NotFoundError("No object with id " + id.to_hex());
  }
  return records.front();
}

bool MetadataIndex::exists(const std::string& name) const {
  bool found = !backend_->find_records(types::RecordFilter::by_name(name)).empty();
  BOOST_LOG_TRIVIAL(debug) << "Metadata index: Name " << name << (found ? " exists" : " not found");
  return found;
}

std::vector<types::ObjectRecord> MetadataIndex::revisions(const std::string& name) const {
  auto records = backend_->find_records(types::RecordFilter::by_name(name));
  std::sort(records.begin(), records.end(), &MetadataIndex::newer_than);
  return records;
}


//==============================================
// PUBLICATION
//==============================================

types::ObjectId MetadataIndex::assign_id() const {
  return types::ObjectId::generate();
}

int64_t MetadataIndex::next_upload_date() {
  static std::atomic<int64_t> last{0};

  int64_t now = std::chrono::duration_cast<std::chrono::microseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();

  int64_t previous = last.load();
  int64_t candidate;
  do {
    candidate = std::max(now, previous + 1);
  } while (!last.compare_exchange_weak(previous, candidate));
  return candidate;
}

void MetadataIndex::publish(const types::ObjectRecord& record) {
  BOOST_LOG_TRIVIAL(info) << "Metadata index: Publishing " << record.id << " as '" << record.name
                          << "' (" << record.length << " bytes, " << record.chunk_count << " chunks)";
  backend_->insert_record(record);
}

bool MetadataIndex::newer_than(const types::ObjectRecord& a, const types::ObjectRecord& b) {
  if (a.upload_date != b.upload_date) {
    return a.upload_date > b.upload_date;
  }
  return b.id < a.id;
}

} // namespace metadata
} // namespace gridsync
