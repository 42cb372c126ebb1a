#pragma once

#include <nlohmann/json.hpp>

#include "modes/mode_types.hpp"

namespace modewarden {
namespace orchestrator {

/**
 * @brief JSON encoding for dump() output
 *
 * Enum values are encoded by name. AP passphrases are never encoded.
 */

nlohmann::json encode_work_source(const modes::WorkSource &ws);
nlohmann::json encode_network_target(const modes::NetworkTarget &target);
nlohmann::json encode_manager_info(const modes::ManagerInfo &info);
nlohmann::json encode_ap_config(const modes::ApConfig &config);
nlohmann::json encode_ap_mode_configuration(const modes::ApModeConfiguration &config);

std::string ap_band_to_string(modes::ApBand band);

}  // namespace orchestrator
}  // namespace modewarden
