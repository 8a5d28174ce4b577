#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "polystore/types.hpp"

namespace polystore {

class FailureLog;

// Last journaled state of one saga
struct SagaJournalEntry {
    std::string saga_id;
    std::string definition;
    std::string state;          // running, compensating, completed, compensated, compensation_failed, interrupted
    int64_t step = -1;          // last step index touched, -1 before the first step
    std::string detail;
    std::string operation_id;                     // chunk upload, once known
    std::map<std::string, std::string> records;   // store role -> inserted record id
    TimePoint started;
    TimePoint updated;

    bool terminal() const;
};

/**
 * Append-only journal of saga state transitions.
 *
 *   BEGIN <saga id> <epoch ms> <definition>
 *   STATE <saga id> <epoch ms> <state> <step> <operation id> <role=id,...> <escaped detail>
 *
 * Empty fields are written as "-". Only sagas still in flight are held in
 * memory: a terminal state drops the entry. Construction replays the file and
 * rewrites it with just the in-flight sagas.
 */
class SagaJournal {
public:
    explicit SagaJournal(std::filesystem::path path);

    void begin(const std::string& saga_id, const std::string& definition);
    void record(const std::string& saga_id, const std::string& state,
                int64_t step = -1, const std::string& detail = "",
                const std::string& operation_id = "",
                const std::map<std::string, std::string>& records = {});

    std::optional<SagaJournalEntry> get(const std::string& saga_id) const;
    // Sagas in flight
    std::vector<SagaJournalEntry> list_all() const;

    // Sagas whose last state is not terminal; after a restart these crashed mid-flight
    std::vector<SagaJournalEntry> interrupted() const;

    const std::filesystem::path& path() const { return path_; }

private:
    static std::string escape(const std::string& s);
    static std::string unescape(const std::string& s);
    // Single space-free token; "-" when empty
    static std::string field(const std::string& s);
    static std::string unfield(const std::string& s);
    static std::string encode_records(const std::map<std::string, std::string>& records);
    static std::map<std::string, std::string> decode_records(const std::string& text);

    static std::string begin_line(const SagaJournalEntry& e);
    static std::string state_line(const SagaJournalEntry& e);

    void append(const std::string& line);
    void replay();
    void compact();

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::map<std::string, SagaJournalEntry> entries_;
};

/**
 * Writes one critical_failure record per interrupted saga and journals it as
 * interrupted, so each is reported once. Returns the number reported.
 */
size_t report_interrupted_sagas(SagaJournal& journal, FailureLog& failure_log);

} // namespace polystore
