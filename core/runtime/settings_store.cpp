#include "settings_store.hpp"

#include "../logging/logger.hpp"

namespace modewarden {
namespace runtime {

ConfigSettingsStore::ConfigSettingsStore(const SettingsConfig &initial)
    : wifi_enabled_(initial.wifi_enabled),
      scan_always_available_(initial.scan_always_available),
      airplane_mode_(initial.airplane_mode),
      location_mode_(initial.location_mode),
      disable_wifi_in_emergency_(initial.disable_wifi_in_emergency) {
    LOG_DEBUG("[Settings] wifi=" << initial.wifi_enabled << " scan_always=" << initial.scan_always_available
                                 << " airplane=" << initial.airplane_mode << " location=" << initial.location_mode
                                 << " ecm_disable=" << initial.disable_wifi_in_emergency);
}

}  // namespace runtime
}  // namespace modewarden
