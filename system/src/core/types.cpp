// ============= src/core/types.cpp =============
#include "core/types.hpp"
#include "core/errors.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace faceattend {

// ==================== STATUS STRINGS ====================

const char* to_string(IdentityStatus status) {
    switch (status) {
        case IdentityStatus::Pending:   return "pending";
        case IdentityStatus::Active:    return "active";
        case IdentityStatus::Rejected:  return "rejected";
        case IdentityStatus::Suspended: return "suspended";
    }
    return "unknown";
}

const char* to_string(RequestStatus status) {
    switch (status) {
        case RequestStatus::Submitted:   return "submitted";
        case RequestStatus::UnderReview: return "under_review";
        case RequestStatus::Approved:    return "approved";
        case RequestStatus::Rejected:    return "rejected";
    }
    return "unknown";
}

const char* to_string(CheckType type) {
    return type == CheckType::Out ? "out" : "in";
}

IdentityStatus identity_status_from_string(const std::string& text) {
    if (text == "pending")   return IdentityStatus::Pending;
    if (text == "active")    return IdentityStatus::Active;
    if (text == "rejected")  return IdentityStatus::Rejected;
    if (text == "suspended") return IdentityStatus::Suspended;
    throw ValidationError("Unknown identity status: " + text);
}

RequestStatus request_status_from_string(const std::string& text) {
    if (text == "submitted")    return RequestStatus::Submitted;
    if (text == "under_review") return RequestStatus::UnderReview;
    if (text == "approved")     return RequestStatus::Approved;
    if (text == "rejected")     return RequestStatus::Rejected;
    throw ValidationError("Unknown request status: " + text);
}

CheckType check_type_from_string(const std::string& text) {
    if (text == "in")  return CheckType::In;
    if (text == "out") return CheckType::Out;
    throw ValidationError("Unknown check type: " + text);
}

// ==================== TIME ====================

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string utc_date(int64_t epoch_ms) {
    std::time_t secs = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);

    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%d");
    return ss.str();
}

std::string format_timestamp(int64_t epoch_ms) {
    std::time_t secs = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm tm_utc{};
    gmtime_r(&secs, &tm_utc);

    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << (epoch_ms % 1000);
    return ss.str();
}

} // namespace faceattend
