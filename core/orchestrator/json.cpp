#include "orchestrator/json.hpp"

namespace modewarden {
namespace orchestrator {

std::string ap_band_to_string(modes::ApBand band) {
    switch (band) {
        case modes::ApBand::BAND_2GHZ:
            return "2GHz";
        case modes::ApBand::BAND_5GHZ:
            return "5GHz";
        case modes::ApBand::BAND_6GHZ:
            return "6GHz";
        case modes::ApBand::BAND_ANY:
            return "any";
        default:
            return "unknown";
    }
}

nlohmann::json encode_work_source(const modes::WorkSource &ws) {
    return nlohmann::json{{"uid", ws.uid}, {"package", ws.package}};
}

nlohmann::json encode_network_target(const modes::NetworkTarget &target) {
    nlohmann::json result = {{"ssid", target.ssid}};
    if (!target.bssid.empty()) {
        result["bssid"] = target.bssid;
    }
    return result;
}

nlohmann::json encode_manager_info(const modes::ManagerInfo &info) {
    nlohmann::json result = {
        {"id", info.id},
        {"role", modes::role_to_string(info.role)},
        {"requestor", encode_work_source(info.requestor)},
    };
    if (!info.interface_name.empty()) {
        result["interface"] = info.interface_name;
    }
    return result;
}

nlohmann::json encode_ap_config(const modes::ApConfig &config) {
    return nlohmann::json{
        {"ssid", config.ssid},
        {"band", ap_band_to_string(config.band)},
        {"channel", config.channel},
        {"hidden", config.hidden},
        {"max_clients", config.max_clients},
        {"secured", !config.passphrase.empty()},
    };
}

nlohmann::json encode_ap_mode_configuration(const modes::ApModeConfiguration &config) {
    nlohmann::json result = {
        {"target_role", modes::role_to_string(config.target_role)},
        {"capability",
         {{"max_supported_clients", config.capability.max_supported_clients},
          {"acs_offload", config.capability.acs_offload},
          {"client_force_disconnect", config.capability.client_force_disconnect}}},
    };
    result["config"] = config.config ? encode_ap_config(*config.config) : nlohmann::json(nullptr);
    return result;
}

}  // namespace orchestrator
}  // namespace modewarden
