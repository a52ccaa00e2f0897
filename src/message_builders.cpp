#ifndef VINFAST_LOG_TAG
#define VINFAST_LOG_TAG "VinFastCloud::Builders"
#endif

#include "message_builders.h"

#include "defs.h"

namespace VinFastCloud {

const std::map<std::string, std::string> &ControlCommandBuilder::get_control_aliases() {
  static const std::map<std::string, std::string> aliases = {
      {CLIMATE_AIR_CONDITION, "3416_0_5850"},
      {CLIMATE_TARGET_TEMPERATURE, "3416_0_5851"},
      {DOOR_LOCK, "3415_0_5850"},
      {DOOR_UNLOCK, "3415_0_5851"},
      {HORN, "3417_0_5850"},
      {LIGHTS, "3417_0_5851"},
  };
  return aliases;
}

bool ControlCommandBuilder::device_key_for(const std::string &alias, std::string &device_key) {
  const auto &aliases = get_control_aliases();
  auto it = aliases.find(alias);
  if (it == aliases.end()) {
    return false;
  }
  device_key = it->second;
  return true;
}

int ControlCommandBuilder::build_control_content(const std::string &alias, const nlohmann::json &value,
                                                 nlohmann::json &content) {
  std::string device_key;
  if (!device_key_for(alias, device_key)) {
    LOG_ERROR("Unknown control alias: %s", alias.c_str());
    return VinFastCloud_Status_E_ERROR_INVALID_PARAMS;
  }
  if (value.is_null()) {
    LOG_ERROR("Missing value for %s", alias.c_str());
    return VinFastCloud_Status_E_ERROR_INVALID_PARAMS;
  }

  content = {{"deviceKey", device_key}, {"value", value}};
  return VinFastCloud_Status_E_OK;
}

}  // namespace VinFastCloud
