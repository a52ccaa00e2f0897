#pragma once

#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "errors.h"

namespace VinFastCloud {

/**
 * @brief Builds message content for remote control commands.
 *
 * Control aliases address a fixed device key ("{objectId}_{instanceId}_{resourceId}") and the
 * content is always {"deviceKey": ..., "value": ...}.
 */
class ControlCommandBuilder {
 public:
  static constexpr const char *CLIMATE_AIR_CONDITION = "CLIMATE_CONTROL_AIR_CONDITION_ENABLE";
  static constexpr const char *CLIMATE_TARGET_TEMPERATURE = "CLIMATE_CONTROL_TARGET_TEMPERATURE";
  static constexpr const char *DOOR_LOCK = "VEHICLE_CONTROL_DOOR_LOCK";
  static constexpr const char *DOOR_UNLOCK = "VEHICLE_CONTROL_DOOR_UNLOCK";
  static constexpr const char *HORN = "VEHICLE_CONTROL_HORN";
  static constexpr const char *LIGHTS = "VEHICLE_CONTROL_LIGHTS";

  /**
   * @brief Build the content for a control alias
   * @param alias One of the control aliases
   * @param value Command value, e.g. 1/0 for switches or degrees Celsius for temperature
   * @param content Output message content
   * @return Error code (0 on success, ERROR_INVALID_PARAMS for unknown aliases or a null value)
   */
  static int build_control_content(const std::string &alias, const nlohmann::json &value, nlohmann::json &content);

  /**
   * @brief Look up the device key for a control alias
   * @return true if the alias is known
   */
  static bool device_key_for(const std::string &alias, std::string &device_key);

  static const std::map<std::string, std::string> &get_control_aliases();
};

}  // namespace VinFastCloud
