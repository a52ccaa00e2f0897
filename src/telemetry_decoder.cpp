#ifndef VINFAST_LOG_TAG
#define VINFAST_LOG_TAG "VinFastCloud::Telemetry"
#endif

#include "telemetry_decoder.h"

#include <cctype>
#include <sstream>

#include "defs.h"
#include "vf_utils.h"

namespace VinFastCloud {

namespace {

const std::map<std::string, std::string> &alias_to_friendly() {
  static const std::map<std::string, std::string> table = {
      {"VEHICLE_STATUS_HV_BATTERY_SOC", "battery_level"},
      {"VEHICLE_STATUS_REMAINING_DISTANCE", "range"},
      {"VEHICLE_STATUS_ODOMETER", "odometer"},
      {"CHARGING_STATUS_CHARGING_STATUS", "charging_status"},
      {"CHARGING_STATUS_CHARGING_REMAINING_TIME", "time_to_full"},
      {"CHARGE_CONTROL_CURRENT_TARGET_SOC", "charge_limit"},
      {"CHARGE_CONTROL_SAMPLE_CHARGE_STATUS", "sample_charge_status"},
      {"VEHICLE_STATUS_IGNITION_STATUS", "ignition"},
      {"VEHICLE_STATUS_GEAR_POSITION", "gear"},
      {"VEHICLE_STATUS_VEHICLE_SPEED", "speed"},
      {"VEHICLE_STATUS_HANDBRAKE_STATUS", "handbrake"},
      {"VEHICLE_STATUS_AMBIENT_TEMPERATURE", "outside_temp"},
      {"CLIMATE_INFORMATION_DRIVER_TEMPERATURE", "inside_temp"},
      {"CLIMATE_INFORMATION_STATUS", "climate_status"},
      {"VEHICLE_STATUS_FRONT_LEFT_TIRE_PRESSURE", "tire_pressure_fl"},
      {"VEHICLE_STATUS_FRONT_RIGHT_TIRE_PRESSURE", "tire_pressure_fr"},
      {"VEHICLE_STATUS_REAR_LEFT_TIRE_PRESSURE", "tire_pressure_rl"},
      {"VEHICLE_STATUS_REAR_RIGHT_TIRE_PRESSURE", "tire_pressure_rr"},
      {"DOOR_AJAR_FRONT_LEFT_DOOR_STATUS", "door_fl"},
      {"DOOR_AJAR_FRONT_RIGHT_DOOR_STATUS", "door_fr"},
      {"DOOR_AJAR_REAR_LEFT_DOOR_STATUS", "door_rl"},
      {"DOOR_AJAR_REAR_RIGHT_DOOR_STATUS", "door_rr"},
      {"DOOR_TRUNK_DOOR_STATUS", "trunk_status"},
      {"REMOTE_CONTROL_DOOR_STATUS", "locked"},
      {"REMOTE_CONTROL_BONNET_CONTROL_STATUS", "hood_status"},
      {"REMOTE_CONTROL_WINDOW_STATUS", "window_status"},
      {"REMOTE_CONTROL_CHARGE_PORT_STATUS", "plugged_in"},
      {"LOCATION_LATITUDE", "latitude"},
      {"LOCATION_LONGITUDE", "longitude"},
      {"VEHICLE_BEARING_DEGREE", "heading"},
  };
  return table;
}

// Leading zeros stripped; a segment of only zeros becomes "0"
bool normalize_numeric_segment(const std::string &segment, std::string &out) {
  if (segment.empty()) {
    return false;
  }
  for (char c : segment) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  size_t first = segment.find_first_not_of('0');
  out = first == std::string::npos ? "0" : segment.substr(first);
  return true;
}

std::vector<std::string> split(const std::string &value, char delimiter) {
  std::vector<std::string> parts;
  std::stringstream ss(value);
  std::string part;
  while (std::getline(ss, part, delimiter)) {
    parts.push_back(part);
  }
  // getline drops a trailing empty field
  if (!value.empty() && value.back() == delimiter) {
    parts.emplace_back();
  }
  return parts;
}

}  // namespace

// TelemetryValue

TelemetryValue TelemetryValue::from_number(double value) {
  TelemetryValue v;
  v.is_numeric = true;
  v.number = value;
  return v;
}

TelemetryValue TelemetryValue::from_text(const std::string &value) {
  TelemetryValue v;
  v.text = value;
  return v;
}

nlohmann::json TelemetryValue::to_json() const {
  if (is_numeric) {
    return number;
  }
  return text;
}

bool TelemetryValue::operator==(const TelemetryValue &other) const {
  if (is_numeric != other.is_numeric) {
    return false;
  }
  return is_numeric ? number == other.number : text == other.text;
}

nlohmann::json snapshot_to_json(const TelemetrySnapshot &snapshot) {
  nlohmann::json out = nlohmann::json::object();
  for (const auto &kv : snapshot) {
    out[kv.first] = kv.second.to_json();
  }
  return out;
}

nlohmann::json TelemetryRequest::to_json() const {
  nlohmann::json out = nlohmann::json::array();
  for (const auto &triple : resources) {
    out.push_back(triple.to_json());
  }
  return out;
}

// TelemetryDecoder

const std::vector<std::string> &TelemetryDecoder::fallback_paths() {
  // Vendor LwM2M object range observed in the mobile app
  static const std::vector<std::string> paths = {
      "/34196/0/0", "/34196/0/1", "/34197/0/0", "/34197/0/1", "/34197/0/2", "/34193/0/0", "/34200/0/0",
      "/34200/0/1", "/34201/0/0", "/34202/0/0", "/34189/0/0", "/34190/0/0", "/34191/0/0", "/34192/0/0",
      "/34194/0/0", "/34195/0/0", "/34198/0/0", "/34199/0/0", "/34203/0/0", "/34204/0/0", "/34205/0/0",
      "/34206/0/0", "/34207/0/0", "/34208/0/0", "/34209/0/0", "/34210/0/0",
  };
  return paths;
}

bool TelemetryDecoder::parse_path(const std::string &path, ResourceTriple &triple) {
  size_t begin = path.find_first_not_of('/');
  size_t end = path.find_last_not_of('/');
  if (begin == std::string::npos) {
    return false;
  }
  auto parts = split(path.substr(begin, end - begin + 1), '/');
  if (parts.size() != 3) {
    return false;
  }
  triple.object_id = parts[0];
  triple.instance_id = parts[1];
  triple.resource_id = parts[2];
  return true;
}

TelemetryRequest TelemetryDecoder::build_request(const AliasMapping &mapping) {
  TelemetryRequest request;

  if (!mapping.empty()) {
    for (const auto &alias : AliasResolver::wanted_aliases()) {
      auto it = mapping.find(alias);
      if (it == mapping.end()) {
        continue;
      }
      request.resources.push_back({it->second.object_id, it->second.instance_id, it->second.resource_id});
      request.path_to_alias[it->second.path] = alias;
    }
    LOG_DEBUG("Using %zu dynamic resources from alias mappings", request.resources.size());
    return request;
  }

  request.from_fallback = true;
  for (const auto &path : fallback_paths()) {
    ResourceTriple triple;
    if (parse_path(path, triple)) {
      request.resources.push_back(triple);
    }
  }
  LOG_DEBUG("Using %zu fallback static resources", request.resources.size());
  return request;
}

bool TelemetryDecoder::device_key_to_path(const std::string &device_key, std::string &path) {
  auto parts = split(device_key, '_');
  if (parts.size() != 3) {
    return false;
  }

  std::string object_id;
  std::string instance_id;
  std::string resource_id;
  if (!normalize_numeric_segment(parts[0], object_id) || !normalize_numeric_segment(parts[1], instance_id) ||
      !normalize_numeric_segment(parts[2], resource_id)) {
    return false;
  }

  path = "/" + object_id + "/" + instance_id + "/" + resource_id;
  return true;
}

std::string TelemetryDecoder::friendly_key(const std::string &alias) {
  const auto &table = alias_to_friendly();
  auto it = table.find(alias);
  if (it != table.end()) {
    return it->second;
  }
  return to_lower(alias);
}

TelemetryValue TelemetryDecoder::coerce_value(const nlohmann::json &value) {
  if (value.is_number()) {
    return TelemetryValue::from_number(value.get<double>());
  }
  if (value.is_boolean()) {
    return TelemetryValue::from_number(value.get<bool>() ? 1.0 : 0.0);
  }
  if (value.is_string()) {
    const auto &text = value.get_ref<const std::string &>();
    double parsed = 0.0;
    if (parse_double(text, parsed)) {
      return TelemetryValue::from_number(parsed);
    }
    return TelemetryValue::from_text(text);
  }
  return TelemetryValue::from_text(value.dump());
}

TelemetrySnapshot TelemetryDecoder::decode(const nlohmann::json &raw_items,
                                           const std::map<std::string, std::string> &path_to_alias) {
  TelemetrySnapshot snapshot;
  if (!raw_items.is_array()) {
    LOG_DEBUG("Ping response is not a list");
    return snapshot;
  }

  for (const auto &item : raw_items) {
    if (!item.is_object()) {
      continue;
    }
    auto key_it = item.find("deviceKey");
    auto value_it = item.find("value");
    if (key_it == item.end() || !key_it->is_string() || value_it == item.end() || value_it->is_null()) {
      continue;
    }
    const auto &device_key = key_it->get_ref<const std::string &>();
    if (device_key.empty()) {
      continue;
    }

    std::string path;
    if (!device_key_to_path(device_key, path)) {
      path = device_key;
    }

    std::string key = path;
    auto alias_it = path_to_alias.find(path);
    if (alias_it != path_to_alias.end()) {
      key = friendly_key(alias_it->second);
    }

    snapshot[key] = coerce_value(*value_it);
  }

  LOG_DEBUG("Parsed %zu telemetry values", snapshot.size());
  return snapshot;
}

}  // namespace VinFastCloud
