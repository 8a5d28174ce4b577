#include "polystore/saga_monitor.hpp"

#include "polystore/logging.hpp"

namespace polystore {

SagaMonitor::SagaMonitor(FailureLog* failure_log) : failure_log_(failure_log) {}

void SagaMonitor::track_saga(const std::string& saga_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_[saga_id] = Clock::now();
}

void SagaMonitor::saga_completed(const std::string& saga_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(saga_id);
    ++completed_;
}

void SagaMonitor::saga_rolled_back(const std::string& saga_id, bool rollback_succeeded) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(saga_id);
    ++failed_;
    if (rollback_succeeded) {
        ++successful_rollbacks_;
    } else {
        ++failed_rollbacks_;
    }
}

void SagaMonitor::alert_rollback_failure(const std::string& saga_id,
                                         const std::vector<std::string>& errors,
                                         const std::map<std::string, std::string>& context) {
    LOG_ERROR("[", saga_id, "] CRITICAL: rollback failed with ", errors.size(),
              " error(s), manual cleanup required");

    if (!failure_log_) return;

    std::map<std::string, std::string> detail = context;
    detail["severity"] = "CRITICAL";
    detail["type"] = "ROLLBACK_FAILURE";
    detail["error_count"] = std::to_string(errors.size());
    std::string joined;
    for (const auto& e : errors) {
        if (!joined.empty()) joined += "; ";
        joined += e;
    }
    detail["errors"] = joined;

    try {
        failure_log_->append(saga_id, FailureKind::RollbackAlert, std::move(detail));
    } catch (const std::exception& e) {
        LOG_ERROR("[", saga_id, "] could not write rollback alert: ", e.what());
    }
}

SagaStats SagaMonitor::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SagaStats stats;
    stats.active = active_.size();
    stats.completed = completed_;
    stats.failed = failed_;
    stats.rolled_back = successful_rollbacks_ + failed_rollbacks_;
    stats.successful_rollbacks = successful_rollbacks_;
    stats.failed_rollbacks = failed_rollbacks_;
    stats.pending_manual_cleanup = failed_rollbacks_;

    const uint64_t finished = completed_ + failed_;
    stats.success_rate = finished == 0 ? 1.0 : static_cast<double>(completed_) / finished;
    return stats;
}

bool SagaMonitor::is_active(const std::string& saga_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(saga_id) > 0;
}

} // namespace polystore
