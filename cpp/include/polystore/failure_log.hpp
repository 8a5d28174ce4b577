#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "polystore/types.hpp"

namespace polystore {

enum class FailureKind {
    OrphanedChunk,
    OrphanedRecord,
    RollbackAlert,
    CriticalFailure
};

const char* to_string(FailureKind kind);
std::optional<FailureKind> parse_failure_kind(std::string_view name);

struct FailureRecord {
    TimePoint timestamp;
    std::string saga_id;
    FailureKind kind = FailureKind::CriticalFailure;
    std::map<std::string, std::string> detail;

    // One JSON object, no trailing newline
    std::string to_json() const;
    static std::optional<FailureRecord> from_json(std::string_view line);
};

/**
 * Append-only durable sink, one JSON object per line.
 *
 * Each record is written with a single write(2) on an O_APPEND descriptor so
 * concurrent writers (threads or processes) never interleave lines. Records
 * are never rewritten or deleted.
 */
class FailureLog {
public:
    explicit FailureLog(std::filesystem::path path);
    ~FailureLog();

    FailureLog(const FailureLog&) = delete;
    FailureLog& operator=(const FailureLog&) = delete;

    // @throws IOError if the record could not be written in full
    void append(const FailureRecord& record);
    void append(const std::string& saga_id, FailureKind kind,
                std::map<std::string, std::string> detail);

    // Lines that fail to parse are skipped with a warning
    std::vector<FailureRecord> read_all() const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
    mutable std::mutex mutex_;
};

} // namespace polystore
