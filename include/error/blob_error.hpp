#ifndef GRIDSYNC_BLOB_ERROR_HPP
#define GRIDSYNC_BLOB_ERROR_HPP

#include <stdexcept>
#include <string>

namespace gridsync {

enum class ErrorCode {
    NOT_FOUND = 0,
    DECODE_ERROR,
    REMOTE_ERROR,
    LOCAL_IO_ERROR,
    CONFIG_ERROR,
    DIGEST_ERROR
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_FOUND: return "Not found";
        case ErrorCode::DECODE_ERROR: return "Decode error";
        case ErrorCode::REMOTE_ERROR: return "Remote error";
        case ErrorCode::LOCAL_IO_ERROR: return "Local I/O error";
        case ErrorCode::CONFIG_ERROR: return "Configuration error";
        case ErrorCode::DIGEST_ERROR: return "Digest error";
        default: return "Undefined error";
    }
}

class BlobError : public std::runtime_error {
public:
    BlobError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(error_code_to_string(code)) + ": " + message)
        , code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Name or identifier has no live record
class NotFoundError : public BlobError {
public:
    explicit NotFoundError(const std::string& message)
        : BlobError(ErrorCode::NOT_FOUND, message) {}
};

// Stored bytes are not valid UTF-8 text
class DecodeError : public BlobError {
public:
    explicit DecodeError(const std::string& message)
        : BlobError(ErrorCode::DECODE_ERROR, message) {}
};

// Failure inside the bucket backend
class RemoteError : public BlobError {
public:
    explicit RemoteError(const std::string& message)
        : BlobError(ErrorCode::REMOTE_ERROR, message) {}
};

// Failure of the local filesystem during sync operations
class LocalIOError : public BlobError {
public:
    explicit LocalIOError(const std::string& message)
        : BlobError(ErrorCode::LOCAL_IO_ERROR, message) {}
};

class ConfigError : public BlobError {
public:
    explicit ConfigError(const std::string& message)
        : BlobError(ErrorCode::CONFIG_ERROR, message) {}
};

// OpenSSL refused a digest or randomness operation
class DigestError : public BlobError {
public:
    explicit DigestError(const std::string& message)
        : BlobError(ErrorCode::DIGEST_ERROR, message) {}
};

} // namespace gridsync

#endif // GRIDSYNC_BLOB_ERROR_HPP
