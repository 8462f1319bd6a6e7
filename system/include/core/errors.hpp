// ============= include/core/errors.hpp =============
#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace faceattend {

class FaceAttendError : public std::runtime_error {
public:
    explicit FaceAttendError(const std::string& msg) : std::runtime_error(msg) {}
};

// Bad input shape. The message is meant for the end user.
class ValidationError : public FaceAttendError {
public:
    explicit ValidationError(const std::string& msg,
                             std::vector<std::string> details = {})
        : FaceAttendError(msg), details_(std::move(details)) {}

    const std::vector<std::string>& details() const { return details_; }

private:
    std::vector<std::string> details_;
};

// Review race lost, or decision on a request that already has one
class AlreadyFinalizedError : public FaceAttendError {
public:
    AlreadyFinalizedError(long long request_id, const std::string& status)
        : FaceAttendError("Request " + std::to_string(request_id) + " is already " + status),
          request_id_(request_id), status_(status) {}

    long long request_id() const { return request_id_; }
    const std::string& status() const { return status_; }

private:
    long long request_id_;
    std::string status_;
};

// Transient. Never to be reported as "no match".
class IndexUnavailableError : public FaceAttendError {
public:
    explicit IndexUnavailableError(const std::string& msg) : FaceAttendError(msg) {}
};

class InconsistentStateError : public FaceAttendError {
public:
    explicit InconsistentStateError(const std::string& msg) : FaceAttendError(msg) {}
};

class NotFoundError : public FaceAttendError {
public:
    explicit NotFoundError(const std::string& msg) : FaceAttendError(msg) {}
};

class StorageError : public FaceAttendError {
public:
    explicit StorageError(const std::string& msg) : FaceAttendError(msg) {}
};

// Embedding provider broke its contract (wrong dimension, NaN, ...)
class ProviderError : public FaceAttendError {
public:
    explicit ProviderError(const std::string& msg) : FaceAttendError(msg) {}
};

} // namespace faceattend
