#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

#include "config.hpp"
#include "modes/collaborators.hpp"
#include "orchestrator/mode_orchestrator.hpp"

namespace modewarden {
namespace runtime {

/**
 * SelfRecovery backed by the orchestrator's restart path.
 *
 * Each trigger asks the orchestrator to restart every manager. Once the restart
 * budget for the sliding window is spent, recovery gives up and disables wifi
 * until the user toggles it again.
 */
class SelfRecoveryService : public modes::SelfRecovery {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit SelfRecoveryService(const RecoveryConfig &config, Clock clock = nullptr);

    // Must be attached before the first trigger
    void attach(orchestrator::ModeOrchestrator *orchestrator);

    void trigger(modes::RecoveryReason reason) override;

    size_t restarts_in_window() const;

private:
    void prune_locked(std::chrono::steady_clock::time_point now);

    RecoveryConfig config_;
    Clock clock_;

    mutable std::mutex mutex_;
    orchestrator::ModeOrchestrator *orchestrator_ = nullptr;
    std::deque<std::chrono::steady_clock::time_point> restarts_;
};

// Diagnostics sink that records requests in the log
class LoggingDiagnostics : public modes::Diagnostics {
public:
    void capture_bug_report_data(modes::RecoveryReason reason) override;
    void take_bug_report(const std::string &title, const std::string &detail) override;

    size_t bug_report_count() const;

private:
    mutable std::mutex mutex_;
    size_t bug_reports_ = 0;
};

}  // namespace runtime
}  // namespace modewarden
