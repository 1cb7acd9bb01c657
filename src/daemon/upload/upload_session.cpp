#include "upload/upload_session.hpp"

std::string_view to_string(UploadStatus s) {
    switch (s) {
        case UploadStatus::Collecting: return "collecting";
        case UploadStatus::Finalizing: return "finalizing";
        case UploadStatus::Completed:  return "completed";
        case UploadStatus::Aborted:    return "aborted";
        case UploadStatus::Expired:    return "expired";
    }
    return "unknown";
}

std::optional<UploadStatus> upload_status_from_string(std::string_view s) {
    if (s == "collecting") return UploadStatus::Collecting;
    if (s == "finalizing") return UploadStatus::Finalizing;
    if (s == "completed") return UploadStatus::Completed;
    if (s == "aborted") return UploadStatus::Aborted;
    if (s == "expired") return UploadStatus::Expired;
    return std::nullopt;
}
