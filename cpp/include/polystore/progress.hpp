#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace polystore {

enum class UploadStatus {
    Pending,
    Uploading,
    Paused,
    Completed,
    Failed,
    Cancelled
};

inline const char* to_string(UploadStatus status) {
    switch (status) {
        case UploadStatus::Pending:   return "pending";
        case UploadStatus::Uploading: return "uploading";
        case UploadStatus::Paused:    return "paused";
        case UploadStatus::Completed: return "completed";
        case UploadStatus::Failed:    return "failed";
        case UploadStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

struct UploadProgress {
    std::string operation_id;
    uint64_t total_bytes = 0;
    uint64_t transferred_bytes = 0;
    uint64_t chunk_count = 0;
    uint64_t current_chunk = 0;
    double percent_complete = 0.0;
    double bytes_per_second = 0.0;
    double estimated_seconds_remaining = 0.0;
    UploadStatus status = UploadStatus::Pending;
};

// Fire-and-forget; exceptions thrown by a sink are logged and dropped
using ProgressSink = std::function<void(const UploadProgress&)>;

} // namespace polystore
