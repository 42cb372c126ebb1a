#pragma once

#include <atomic>

#include "config.hpp"
#include "modes/collaborators.hpp"

namespace modewarden {
namespace runtime {

/**
 * Settings store seeded from the settings: section.
 *
 * Values are atomics so operator tooling can flip them from any thread; the
 * orchestrator only sees a change once the matching intent is posted.
 */
class ConfigSettingsStore : public modes::SettingsStore {
public:
    explicit ConfigSettingsStore(const SettingsConfig &initial);

    bool is_toggle_enabled() const override { return wifi_enabled_.load(); }
    bool is_scan_always_available() const override { return scan_always_available_.load(); }
    bool is_airplane_mode_on() const override { return airplane_mode_.load(); }
    bool is_location_mode_enabled() const override { return location_mode_.load(); }
    bool is_wifi_disabled_in_emergency() const override { return disable_wifi_in_emergency_.load(); }

    void set_toggle_enabled(bool enabled) { wifi_enabled_.store(enabled); }
    void set_scan_always_available(bool available) { scan_always_available_.store(available); }
    void set_airplane_mode(bool on) { airplane_mode_.store(on); }
    void set_location_mode(bool enabled) { location_mode_.store(enabled); }
    void set_wifi_disabled_in_emergency(bool disabled) { disable_wifi_in_emergency_.store(disabled); }

private:
    std::atomic<bool> wifi_enabled_;
    std::atomic<bool> scan_always_available_;
    std::atomic<bool> airplane_mode_;
    std::atomic<bool> location_mode_;
    std::atomic<bool> disable_wifi_in_emergency_;
};

}  // namespace runtime
}  // namespace modewarden
