#pragma once

/**
 * @file simulated_radio.hpp
 * @brief In-process radio back end for the runtime and for integration tests
 *
 * Plays both external collaborators the orchestrator needs from a driver layer:
 * the mode manager factory and the interface controller. Managers complete
 * start/stop after a configurable latency on the radio's timer thread; with
 * zero latency they complete inline, which keeps tests deterministic.
 *
 * Without STA+AP concurrency, an access point that comes up pre-empts every
 * running client manager (reported as a stop), as a single-radio driver would.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "modes/collaborators.hpp"
#include "modes/mode_manager.hpp"
#include "modes/mode_manager_factory.hpp"

namespace modewarden {
namespace sim {

struct SimulationConfig {
    int start_latency_ms = 50;
    int stop_latency_ms = 20;
    int max_client_interfaces = 2;
    int max_ap_interfaces = 1;
    bool sta_ap_concurrency = true;
    std::vector<modes::Role> fail_start_roles;  // Start always fails for these roles
};

class SimulatedRadio : public modes::ModeManagerFactory, public modes::InterfaceController {
public:
    explicit SimulatedRadio(const SimulationConfig &config);
    ~SimulatedRadio() override;

    SimulatedRadio(const SimulatedRadio &) = delete;
    SimulatedRadio &operator=(const SimulatedRadio &) = delete;

    // Timer thread for non-zero latencies
    bool start();
    void stop();

    // ModeManagerFactory
    std::shared_ptr<modes::ClientModeManager> make_client_mode_manager(
        std::shared_ptr<modes::ModeManagerListener> listener, const modes::WorkSource &requestor, modes::Role role,
        bool verbose) override;
    std::shared_ptr<modes::AccessPointManager> make_access_point_manager(
        std::shared_ptr<modes::ModeManagerListener> listener, std::shared_ptr<modes::AccessPointCallback> callback,
        const modes::ApModeConfiguration &config, const modes::WorkSource &requestor, modes::Role role,
        bool verbose) override;

    // InterfaceController
    bool can_create_client_interface(const modes::WorkSource &requestor) const override;
    bool can_create_ap_interface(const modes::WorkSource &requestor) const override;
    bool is_sta_ap_concurrency_supported() const override;
    bool is_sta_sta_concurrency_supported() const override;
    void set_multi_sta_use_case(modes::MultiStaUseCase use_case) override;
    void set_multi_sta_primary_connection(const std::string &interface_name) override;

    // Network every client manager reports as connected (std::nullopt = disconnected)
    void set_connected_network(const std::optional<modes::NetworkTarget> &network);
    std::optional<modes::NetworkTarget> connected_network() const;

    size_t client_interfaces_in_use() const;
    size_t ap_interfaces_in_use() const;
    std::string multi_sta_primary_interface() const;
    std::optional<modes::MultiStaUseCase> multi_sta_use_case() const;

private:
    class SimClientModeManager;
    class SimAccessPointManager;

    using Task = std::function<void()>;

    // Runs inline when delay is zero or the timer thread is not running
    void schedule(std::chrono::milliseconds delay, Task task);
    void timer_loop();

    bool should_fail(modes::Role role) const;
    std::optional<std::string> acquire_interface(bool ap);
    void release_interface(const std::string &name);
    void preempt_clients();

    SimulationConfig config_;

    mutable std::mutex mutex_;
    std::set<std::string> client_interfaces_;
    std::set<std::string> ap_interfaces_;
    std::vector<std::weak_ptr<SimClientModeManager>> clients_;
    std::optional<modes::NetworkTarget> connected_network_;
    std::string multi_sta_primary_;
    std::optional<modes::MultiStaUseCase> multi_sta_use_case_;

    std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    std::multimap<std::chrono::steady_clock::time_point, Task> timers_;
    std::atomic<bool> running_{false};
    std::unique_ptr<std::thread> timer_thread_;
};

}  // namespace sim
}  // namespace modewarden
