#include "recovery_service.hpp"

#include "../logging/logger.hpp"

namespace modewarden {
namespace runtime {

SelfRecoveryService::SelfRecoveryService(const RecoveryConfig &config, Clock clock)
    : config_(config), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

void SelfRecoveryService::attach(orchestrator::ModeOrchestrator *orchestrator) {
    std::lock_guard<std::mutex> lock(mutex_);
    orchestrator_ = orchestrator;
}

void SelfRecoveryService::trigger(modes::RecoveryReason reason) {
    orchestrator::ModeOrchestrator *target = nullptr;
    bool exhausted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target = orchestrator_;
        if (!target) {
            LOG_ERROR("[Recovery] Trigger (" << modes::recovery_reason_to_string(reason)
                                             << ") before orchestrator attached");
            return;
        }

        const auto now = clock_();
        prune_locked(now);
        if (static_cast<int>(restarts_.size()) >= config_.max_restarts_in_window) {
            exhausted = true;
        } else {
            restarts_.push_back(now);
        }
    }

    if (exhausted) {
        LOG_ERROR("[Recovery] Restart budget exhausted (" << config_.max_restarts_in_window << " per "
                                                         << config_.restart_window_ms << "ms), disabling wifi");
        target->recovery_disable();
        return;
    }

    LOG_WARN("[Recovery] Restarting wifi: " << modes::recovery_reason_to_string(reason));
    target->restart_all(reason);
}

size_t SelfRecoveryService::restarts_in_window() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cutoff = clock_() - std::chrono::milliseconds(config_.restart_window_ms);
    size_t count = 0;
    for (const auto &at : restarts_) {
        if (at > cutoff) {
            ++count;
        }
    }
    return count;
}

void SelfRecoveryService::prune_locked(std::chrono::steady_clock::time_point now) {
    const auto cutoff = now - std::chrono::milliseconds(config_.restart_window_ms);
    while (!restarts_.empty() && restarts_.front() <= cutoff) {
        restarts_.pop_front();
    }
}

void LoggingDiagnostics::capture_bug_report_data(modes::RecoveryReason reason) {
    LOG_WARN("[Diagnostics] Capturing firmware state: " << modes::recovery_reason_to_string(reason));
}

void LoggingDiagnostics::take_bug_report(const std::string &title, const std::string &detail) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++bug_reports_;
    }
    LOG_WARN("[Diagnostics] " << title << ": " << detail);
}

size_t LoggingDiagnostics::bug_report_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bug_reports_;
}

}  // namespace runtime
}  // namespace modewarden
