#ifndef GRIDSYNC_STORE_BUCKET_BACKEND_HPP
#define GRIDSYNC_STORE_BUCKET_BACKEND_HPP

#include <cstdint>
#include <optional>
#include <vector>
#include "types/object_record.hpp"

namespace gridsync {
namespace store {

// Primitives the client core needs from the underlying chunked store.
// Implementations report their own failures as RemoteError.
class BucketBackend {
public:
    virtual ~BucketBackend() = default;

    // ---- CHUNK OPERATIONS ----
    virtual void insert_chunk(const types::ObjectId& id, uint32_t n, const types::Bytes& data) = 0;
    virtual std::optional<types::Bytes> find_chunk(const types::ObjectId& id, uint32_t n) = 0;
    virtual void delete_chunks(const types::ObjectId& id) = 0;

    // ---- RECORD OPERATIONS ----
    // Publication is atomic: a record is either fully visible or absent
    virtual void insert_record(const types::ObjectRecord& record) = 0;
    virtual std::vector<types::ObjectRecord> find_records(const types::RecordFilter& filter) = 0;
    virtual bool delete_record(const types::ObjectId& id) = 0;
};

} // namespace store
} // namespace gridsync

#endif // GRIDSYNC_STORE_BUCKET_BACKEND_HPP
