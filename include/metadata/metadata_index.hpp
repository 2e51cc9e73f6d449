#ifndef GRIDSYNC_METADATA_INDEX_HPP
#define GRIDSYNC_METADATA_INDEX_HPP

#include <memory>
#include <string>
#include <vector>
#include "store/bucket_backend.hpp"

namespace gridsync {
namespace metadata {

// Name -> identifier lookup over the bucket's published records.
//
// Names are not unique in the store. When several records share a name the
// most recently created one wins: greatest upload_date, then greatest
// ObjectId.
class MetadataIndex {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit MetadataIndex(std::shared_ptr<store::BucketBackend> backend);


  // ---- LOOKUP OPERATIONS ----
  // Throws NotFoundError when no record carries the name
  types::ObjectId resolve(const std::string& name) const;
  // Throws NotFoundError for unknown identifiers
  types::ObjectRecord describe(const types::ObjectId& id) const;
  // False for missing names; backend failures still propagate
  bool exists(const std::string& name) const;
  // All records for a name, newest first
  std::vector<types::ObjectRecord> revisions(const std::string& name) const;


  // ---- PUBLICATION ----
  types::ObjectId assign_id() const;
  // Strictly increasing within this process
  static int64_t next_upload_date();
  void publish(const types::ObjectRecord& record);

private:
  // ---- PARAMETERS ----
  std::shared_ptr<store::BucketBackend> backend_;

  static bool newer_than(const types::ObjectRecord& a, const types::ObjectRecord& b);
};

} // namespace metadata
} // namespace gridsync

#endif // GRIDSYNC_METADATA_INDEX_HPP
