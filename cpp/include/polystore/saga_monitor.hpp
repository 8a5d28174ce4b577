#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "polystore/failure_log.hpp"
#include "polystore/types.hpp"

namespace polystore {

struct SagaStats {
    uint64_t active = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;
    uint64_t rolled_back = 0;
    uint64_t successful_rollbacks = 0;
    uint64_t failed_rollbacks = 0;
    uint64_t pending_manual_cleanup = 0;

    // Fraction in [0, 1] of finished sagas that completed; 1.0 before anything finished
    double success_rate = 1.0;

    // success_rate on a 0-100 scale, as status reports print it
    double success_percent() const { return success_rate * 100.0; }
};

/**
 * Observes saga lifecycles and raises alerts on failed rollbacks.
 * Thread-safe. Owned by the caller; pass it to every executor that should
 * report into it.
 */
class SagaMonitor {
public:
    explicit SagaMonitor(FailureLog* failure_log = nullptr);

    void track_saga(const std::string& saga_id);
    void saga_completed(const std::string& saga_id);
    void saga_rolled_back(const std::string& saga_id, bool rollback_succeeded);

    // Writes a CRITICAL rollback_alert record
    void alert_rollback_failure(const std::string& saga_id,
                                const std::vector<std::string>& errors,
                                const std::map<std::string, std::string>& context = {});

    SagaStats get_stats() const;
    bool is_active(const std::string& saga_id) const;

private:
    FailureLog* failure_log_;
    mutable std::mutex mutex_;
    std::map<std::string, TimePoint> active_;
    uint64_t completed_ = 0;
    uint64_t failed_ = 0;
    uint64_t successful_rollbacks_ = 0;
    uint64_t failed_rollbacks_ = 0;
};

} // namespace polystore
