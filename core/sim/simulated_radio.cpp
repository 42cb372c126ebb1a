#include "sim/simulated_radio.hpp"

#include <algorithm>
#include <exception>

#include "logging/logger.hpp"

namespace modewarden {
namespace sim {

using modes::Role;

namespace {

enum class SimState { IDLE, STARTING, RUNNING, STOPPING, STOPPED };

int frequency_for_band(modes::ApBand band) {
    switch (band) {
        case modes::ApBand::BAND_5GHZ:
            return 5180;
        case modes::ApBand::BAND_6GHZ:
            return 5955;
        default:
            return 2412;
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// Client manager
// ---------------------------------------------------------------------------

class SimulatedRadio::SimClientModeManager : public modes::ClientModeManager,
                                             public std::enable_shared_from_this<SimClientModeManager> {
public:
    SimClientModeManager(SimulatedRadio &radio, std::shared_ptr<modes::ModeManagerListener> listener, Role role,
                         bool verbose)
        : radio_(radio), listener_(std::move(listener)), role_(role), verbose_(verbose) {}

    void start() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SimState::IDLE) {
                return;
            }
            state_ = SimState::STARTING;
        }
        const bool fail = radio_.should_fail(role_);
        auto self = shared_from_this();
        radio_.schedule(std::chrono::milliseconds(radio_.config_.start_latency_ms),
                        [self, fail] { self->complete_start(fail); });
    }

    void stop() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SimState::RUNNING && state_ != SimState::STARTING) {
                return;
            }
            state_ = SimState::STOPPING;
        }
        auto self = shared_from_this();
        radio_.schedule(std::chrono::milliseconds(radio_.config_.stop_latency_ms), [self] { self->complete_stop(); });
    }

    std::string interface_name() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return interface_;
    }

    void enable_verbose_logging(bool verbose) override {
        std::lock_guard<std::mutex> lock(mutex_);
        verbose_ = verbose;
    }

    void set_role(Role role, const modes::WorkSource &requestor) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SimState::RUNNING) {
                return;
            }
        }
        LOG_DEBUG("[SimRadio] " << interface_name() << " switching to " << modes::role_to_string(role) << " for "
                                << modes::work_source_to_string(requestor));
        auto self = shared_from_this();
        radio_.schedule(std::chrono::milliseconds(radio_.config_.start_latency_ms), [self, role] {
            {
                std::lock_guard<std::mutex> lock(self->mutex_);
                if (self->state_ != SimState::RUNNING) {
                    return;
                }
                self->role_ = role;
            }
            self->listener_->on_role_changed();
        });
    }

    std::optional<modes::NetworkTarget> connected_network() const override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SimState::RUNNING || !modes::is_connectivity_role(role_)) {
                return std::nullopt;
            }
        }
        return radio_.connected_network();
    }

    // Driver tore the interface down for an access point
    void preempt() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SimState::RUNNING) {
                return;
            }
            state_ = SimState::STOPPING;
        }
        LOG_INFO("[SimRadio] " << interface_name() << " pre-empted by access point");
        complete_stop();
    }

private:
    void complete_start(bool fail) {
        std::optional<std::string> name;
        bool verbose = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SimState::STARTING) {
                return;
            }
            verbose = verbose_;
            if (!fail) {
                name = radio_.acquire_interface(false);
            }
            if (!name) {
                state_ = SimState::STOPPED;
            } else {
                state_ = SimState::RUNNING;
                interface_ = *name;
            }
        }

        if (!name) {
            LOG_WARN("[SimRadio] " << modes::role_to_string(role_) << " start failed");
            listener_->on_start_failure();
            return;
        }
        if (verbose) {
            LOG_DEBUG("[SimRadio] " << *name << " up as " << modes::role_to_string(role_));
        }
        listener_->on_started();
    }

    void complete_stop() {
        std::string name;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SimState::STOPPING) {
                return;
            }
            state_ = SimState::STOPPED;
            name.swap(interface_);
        }
        if (!name.empty()) {
            radio_.release_interface(name);
        }
        listener_->on_stopped();
    }

    SimulatedRadio &radio_;
    std::shared_ptr<modes::ModeManagerListener> listener_;

    mutable std::mutex mutex_;
    Role role_;
    bool verbose_;
    SimState state_ = SimState::IDLE;
    std::string interface_;
};

// ---------------------------------------------------------------------------
// Access point manager
// ---------------------------------------------------------------------------

class SimulatedRadio::SimAccessPointManager : public modes::AccessPointManager,
                                              public std::enable_shared_from_this<SimAccessPointManager> {
public:
    SimAccessPointManager(SimulatedRadio &radio, std::shared_ptr<modes::ModeManagerListener> listener,
                          std::shared_ptr<modes::AccessPointCallback> callback,
                          const modes::ApModeConfiguration &config, Role role, bool verbose)
        : radio_(radio),
          listener_(std::move(listener)),
          callback_(std::move(callback)),
          config_(config),
          role_(role),
          verbose_(verbose) {}

    void start() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SimState::IDLE) {
                return;
            }
            state_ = SimState::STARTING;
        }
        report_state(modes::ApState::ENABLING, modes::ApStartFailure::GENERAL);

        const bool fail = radio_.should_fail(role_);
        auto self = shared_from_this();
        radio_.schedule(std::chrono::milliseconds(radio_.config_.start_latency_ms),
                        [self, fail] { self->complete_start(fail); });
    }

    void stop() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SimState::RUNNING && state_ != SimState::STARTING) {
                return;
            }
            state_ = SimState::STOPPING;
        }
        report_state(modes::ApState::DISABLING, modes::ApStartFailure::GENERAL);

        auto self = shared_from_this();
        radio_.schedule(std::chrono::milliseconds(radio_.config_.stop_latency_ms), [self] { self->complete_stop(); });
    }

    std::string interface_name() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return interface_;
    }

    void enable_verbose_logging(bool verbose) override {
        std::lock_guard<std::mutex> lock(mutex_);
        verbose_ = verbose;
    }

    void update_capability(const modes::ApCapability &capability) override {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.capability = capability;
    }

    void update_configuration(const modes::ApConfig &config) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            config_.config = config;
        }
        LOG_INFO("[SimRadio] " << modes::role_to_string(role_) << " configuration updated (ssid " << config.ssid
                               << ")");
    }

private:
    void complete_start(bool fail) {
        std::optional<std::string> name;
        modes::ApInfo info;
        bool verbose = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SimState::STARTING) {
                return;
            }
            verbose = verbose_;
            if (!fail) {
                name = radio_.acquire_interface(true);
            }
            if (!name) {
                state_ = SimState::STOPPED;
            } else {
                state_ = SimState::RUNNING;
                interface_ = *name;
                info.frequency_mhz = frequency_for_band(config_.config ? config_.config->band : modes::ApBand::BAND_2GHZ);
                info.bandwidth_mhz = 20;
                info.bssid = "02:00:00:00:00:0" + std::to_string(interface_.back() - '0');
            }
        }

        if (!name) {
            LOG_WARN("[SimRadio] " << modes::role_to_string(role_) << " start failed");
            report_state(modes::ApState::FAILED, modes::ApStartFailure::GENERAL);
            listener_->on_start_failure();
            return;
        }

        if (verbose) {
            LOG_DEBUG("[SimRadio] " << *name << " up as " << modes::role_to_string(role_) << " on "
                                    << info.frequency_mhz << "MHz");
        }

        if (!radio_.config_.sta_ap_concurrency) {
            radio_.preempt_clients();
        }

        report_state(modes::ApState::ENABLED, modes::ApStartFailure::GENERAL);
        if (callback_) {
            try {
                callback_->on_info_changed(info);
            } catch (const std::exception &e) {
                LOG_ERROR("[SimRadio] Error in access point info callback: " << e.what());
            }
        }
        listener_->on_started();
    }

    void complete_stop() {
        std::string name;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != SimState::STOPPING) {
                return;
            }
            state_ = SimState::STOPPED;
            name.swap(interface_);
        }
        if (!name.empty()) {
            radio_.release_interface(name);
        }
        report_state(modes::ApState::DISABLED, modes::ApStartFailure::GENERAL);
        listener_->on_stopped();
    }

    void report_state(modes::ApState state, modes::ApStartFailure failure) {
        if (!callback_) {
            return;
        }
        try {
            callback_->on_state_changed(state, failure);
        } catch (const std::exception &e) {
            LOG_ERROR("[SimRadio] Error in access point state callback: " << e.what());
        }
    }

    SimulatedRadio &radio_;
    std::shared_ptr<modes::ModeManagerListener> listener_;
    std::shared_ptr<modes::AccessPointCallback> callback_;

    mutable std::mutex mutex_;
    modes::ApModeConfiguration config_;
    Role role_;
    bool verbose_;
    SimState state_ = SimState::IDLE;
    std::string interface_;
};

// ---------------------------------------------------------------------------
// SimulatedRadio
// ---------------------------------------------------------------------------

SimulatedRadio::SimulatedRadio(const SimulationConfig &config) : config_(config) {}

SimulatedRadio::~SimulatedRadio() { stop(); }

bool SimulatedRadio::start() {
    if (running_) {
        LOG_ERROR("[SimRadio] Already running");
        return false;
    }
    running_ = true;
    timer_thread_ = std::make_unique<std::thread>(&SimulatedRadio::timer_loop, this);

    LOG_INFO("[SimRadio] Started (clients=" << config_.max_client_interfaces << ", aps=" << config_.max_ap_interfaces
                                            << ", sta+ap=" << (config_.sta_ap_concurrency ? "yes" : "no") << ")");
    return true;
}

void SimulatedRadio::stop() {
    if (!running_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        running_ = false;
    }
    timer_cv_.notify_all();

    if (timer_thread_ && timer_thread_->joinable()) {
        timer_thread_->join();
    }
    timer_thread_.reset();

    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (!timers_.empty()) {
        LOG_DEBUG("[SimRadio] Dropping " << timers_.size() << " pending radio operations");
        timers_.clear();
    }
}

void SimulatedRadio::schedule(std::chrono::milliseconds delay, Task task) {
    if (delay.count() <= 0 || !running_) {
        task();
        return;
    }
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        timers_.emplace(std::chrono::steady_clock::now() + delay, std::move(task));
    }
    timer_cv_.notify_one();
}

void SimulatedRadio::timer_loop() {
    std::unique_lock<std::mutex> lock(timer_mutex_);
    while (running_) {
        if (timers_.empty()) {
            timer_cv_.wait(lock, [this] { return !running_ || !timers_.empty(); });
            continue;
        }

        auto next = timers_.begin();
        if (next->first > std::chrono::steady_clock::now()) {
            timer_cv_.wait_until(lock, next->first);
            continue;
        }

        Task task = std::move(next->second);
        timers_.erase(next);

        lock.unlock();
        try {
            task();
        } catch (const std::exception &e) {
            LOG_ERROR("[SimRadio] Radio operation failed: " << e.what());
        }
        lock.lock();
    }
}

std::shared_ptr<modes::ClientModeManager> SimulatedRadio::make_client_mode_manager(
    std::shared_ptr<modes::ModeManagerListener> listener, const modes::WorkSource &requestor, Role role,
    bool verbose) {
    if (!listener || !modes::is_client_role(role)) {
        LOG_ERROR("[SimRadio] Cannot build client manager for " << modes::role_to_string(role));
        return nullptr;
    }

    auto manager = std::make_shared<SimClientModeManager>(*this, std::move(listener), role, verbose);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        clients_.erase(std::remove_if(clients_.begin(), clients_.end(),
                                      [](const std::weak_ptr<SimClientModeManager> &c) { return c.expired(); }),
                       clients_.end());
        clients_.push_back(manager);
    }

    LOG_DEBUG("[SimRadio] Built " << modes::role_to_string(role) << " manager for "
                                  << modes::work_source_to_string(requestor));
    return manager;
}

std::shared_ptr<modes::AccessPointManager> SimulatedRadio::make_access_point_manager(
    std::shared_ptr<modes::ModeManagerListener> listener, std::shared_ptr<modes::AccessPointCallback> callback,
    const modes::ApModeConfiguration &config, const modes::WorkSource &requestor, Role role, bool verbose) {
    if (!listener || !modes::is_ap_role(role)) {
        LOG_ERROR("[SimRadio] Cannot build access point manager for " << modes::role_to_string(role));
        return nullptr;
    }

    LOG_DEBUG("[SimRadio] Built " << modes::role_to_string(role) << " manager for "
                                  << modes::work_source_to_string(requestor));
    return std::make_shared<SimAccessPointManager>(*this, std::move(listener), std::move(callback), config, role,
                                                   verbose);
}

bool SimulatedRadio::can_create_client_interface(const modes::WorkSource &) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!config_.sta_ap_concurrency && !ap_interfaces_.empty()) {
        return false;
    }
    return static_cast<int>(client_interfaces_.size()) < config_.max_client_interfaces;
}

bool SimulatedRadio::can_create_ap_interface(const modes::WorkSource &) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(ap_interfaces_.size()) < config_.max_ap_interfaces;
}

bool SimulatedRadio::is_sta_ap_concurrency_supported() const { return config_.sta_ap_concurrency; }

bool SimulatedRadio::is_sta_sta_concurrency_supported() const { return config_.max_client_interfaces > 1; }

void SimulatedRadio::set_multi_sta_use_case(modes::MultiStaUseCase use_case) {
    std::lock_guard<std::mutex> lock(mutex_);
    multi_sta_use_case_ = use_case;
    LOG_DEBUG("[SimRadio] Multi-STA use case " << modes::multi_sta_use_case_to_string(use_case));
}

void SimulatedRadio::set_multi_sta_primary_connection(const std::string &interface_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    multi_sta_primary_ = interface_name;
    LOG_DEBUG("[SimRadio] Multi-STA primary " << interface_name);
}

void SimulatedRadio::set_connected_network(const std::optional<modes::NetworkTarget> &network) {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_network_ = network;
}

std::optional<modes::NetworkTarget> SimulatedRadio::connected_network() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_network_;
}

size_t SimulatedRadio::client_interfaces_in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_interfaces_.size();
}

size_t SimulatedRadio::ap_interfaces_in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ap_interfaces_.size();
}

std::string SimulatedRadio::multi_sta_primary_interface() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return multi_sta_primary_;
}

std::optional<modes::MultiStaUseCase> SimulatedRadio::multi_sta_use_case() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return multi_sta_use_case_;
}

bool SimulatedRadio::should_fail(Role role) const {
    return std::find(config_.fail_start_roles.begin(), config_.fail_start_roles.end(), role) !=
           config_.fail_start_roles.end();
}

std::optional<std::string> SimulatedRadio::acquire_interface(bool ap) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto &in_use = ap ? ap_interfaces_ : client_interfaces_;
    const int limit = ap ? config_.max_ap_interfaces : config_.max_client_interfaces;
    if (static_cast<int>(in_use.size()) >= limit) {
        return std::nullopt;
    }
    if (!ap && !config_.sta_ap_concurrency && !ap_interfaces_.empty()) {
        return std::nullopt;
    }

    const std::string prefix = ap ? "ap" : "wlan";
    for (int index = 0;; ++index) {
        std::string name = prefix + std::to_string(index);
        if (in_use.count(name) == 0) {
            in_use.insert(name);
            return name;
        }
    }
}

void SimulatedRadio::release_interface(const std::string &name) {
    std::lock_guard<std::mutex> lock(mutex_);
    client_interfaces_.erase(name);
    ap_interfaces_.erase(name);
}

void SimulatedRadio::preempt_clients() {
    std::vector<std::shared_ptr<SimClientModeManager>> victims;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &weak : clients_) {
            if (auto client = weak.lock()) {
                victims.push_back(client);
            }
        }
    }
    for (const auto &client : victims) {
        client->preempt();
    }
}

}  // namespace sim
}  // namespace modewarden
