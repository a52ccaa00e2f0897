#ifndef VINFAST_LOG_TAG
#define VINFAST_LOG_TAG "VinFastCloud::Alias"
#endif

#include "alias_resolver.h"

#include <utility>

#include "defs.h"
#include "vf_utils.h"

namespace VinFastCloud {

namespace {

std::string field_string(const nlohmann::json &entry, const char *key, const std::string &fallback) {
  auto it = entry.find(key);
  if (it == entry.end() || it->is_null()) {
    return fallback;
  }
  return json_scalar_to_string(*it);
}

bool is_non_empty_array(const nlohmann::json &value) { return value.is_array() && !value.empty(); }

}  // namespace

const char *alias_catalog_shape_to_string(AliasCatalogShape shape) {
  switch (shape) {
    case AliasCatalogShape::DATA_RESOURCES:
      return "data.resources";
    case AliasCatalogShape::DATA_LIST:
      return "data[]";
    case AliasCatalogShape::RESOURCES:
      return "resources";
    case AliasCatalogShape::BARE_LIST:
      return "list";
    case AliasCatalogShape::UNRECOGNIZED:
    default:
      return "unrecognized";
  }
}

AliasResolver::AliasResolver(std::shared_ptr<Session> session) : session_(std::move(session)) {}

const std::vector<std::string> &AliasResolver::wanted_aliases() {
  static const std::vector<std::string> aliases = {
      // Battery & charging
      "VEHICLE_STATUS_HV_BATTERY_SOC",
      "VEHICLE_STATUS_REMAINING_DISTANCE",
      "VEHICLE_STATUS_ODOMETER",
      "CHARGING_STATUS_CHARGING_STATUS",
      "CHARGING_STATUS_CHARGING_REMAINING_TIME",
      "CHARGE_CONTROL_CURRENT_TARGET_SOC",
      "CHARGE_CONTROL_SAMPLE_CHARGE_STATUS",
      // Drive state
      "VEHICLE_STATUS_IGNITION_STATUS",
      "VEHICLE_STATUS_GEAR_POSITION",
      "VEHICLE_STATUS_VEHICLE_SPEED",
      "VEHICLE_STATUS_HANDBRAKE_STATUS",
      // Climate
      "VEHICLE_STATUS_AMBIENT_TEMPERATURE",
      "CLIMATE_INFORMATION_DRIVER_TEMPERATURE",
      "CLIMATE_INFORMATION_STATUS",
      // Tires
      "VEHICLE_STATUS_FRONT_LEFT_TIRE_PRESSURE",
      "VEHICLE_STATUS_FRONT_RIGHT_TIRE_PRESSURE",
      "VEHICLE_STATUS_REAR_LEFT_TIRE_PRESSURE",
      "VEHICLE_STATUS_REAR_RIGHT_TIRE_PRESSURE",
      // Closures
      "DOOR_AJAR_FRONT_LEFT_DOOR_STATUS",
      "DOOR_AJAR_FRONT_RIGHT_DOOR_STATUS",
      "DOOR_AJAR_REAR_LEFT_DOOR_STATUS",
      "DOOR_AJAR_REAR_RIGHT_DOOR_STATUS",
      "DOOR_TRUNK_DOOR_STATUS",
      "REMOTE_CONTROL_DOOR_STATUS",
      "REMOTE_CONTROL_BONNET_CONTROL_STATUS",
      "REMOTE_CONTROL_WINDOW_STATUS",
      "REMOTE_CONTROL_CHARGE_PORT_STATUS",
      // Location
      "LOCATION_LATITUDE",
      "LOCATION_LONGITUDE",
      "VEHICLE_BEARING_DEGREE",
  };
  return aliases;
}

size_t AliasResolver::count_wanted(const AliasMapping &mapping) {
  size_t found = 0;
  for (const auto &alias : wanted_aliases()) {
    if (mapping.count(alias) > 0) {
      found++;
    }
  }
  return found;
}

AliasCatalog AliasResolver::parse_catalog(const nlohmann::json &body) {
  AliasCatalog catalog;

  if (body.is_array()) {
    catalog.shape = AliasCatalogShape::BARE_LIST;
    catalog.resources = body;
    return catalog;
  }
  if (!body.is_object()) {
    return catalog;
  }

  auto data = body.find("data");
  if (data != body.end()) {
    if (data->is_object()) {
      auto nested = data->find("resources");
      if (nested != data->end() && is_non_empty_array(*nested)) {
        catalog.shape = AliasCatalogShape::DATA_RESOURCES;
        catalog.resources = *nested;
        return catalog;
      }
    } else if (is_non_empty_array(*data)) {
      catalog.shape = AliasCatalogShape::DATA_LIST;
      catalog.resources = *data;
      return catalog;
    }
  }

  auto resources = body.find("resources");
  if (resources != body.end() && resources->is_array()) {
    catalog.shape = AliasCatalogShape::RESOURCES;
    catalog.resources = *resources;
  }
  return catalog;
}

AliasMapping AliasResolver::build_mapping(const nlohmann::json &resources) {
  AliasMapping mapping;
  if (!resources.is_array()) {
    return mapping;
  }

  for (const auto &resource : resources) {
    if (!resource.is_object()) {
      continue;
    }
    auto alias_it = resource.find("alias");
    if (alias_it == resource.end() || !alias_it->is_string() || alias_it->get<std::string>().empty()) {
      continue;
    }

    AliasEntry entry;
    entry.object_id = field_string(resource, "devObjID", "");
    if (entry.object_id.empty()) {
      LOG_VERBOSE("Skipping alias %s without object id", alias_it->get<std::string>().c_str());
      continue;
    }
    entry.instance_id = field_string(resource, "devObjInstID", "0");
    entry.resource_id = field_string(resource, "devRsrcID", "0");
    entry.path = "/" + entry.object_id + "/" + entry.instance_id + "/" + entry.resource_id;
    entry.name = field_string(resource, "name", "");
    entry.units = field_string(resource, "units", "");
    entry.type = field_string(resource, "type", "");

    mapping[alias_it->get<std::string>()] = std::move(entry);
  }
  return mapping;
}

AliasMapping AliasResolver::resolve(const std::string &version) {
  {
    std::lock_guard<std::mutex> guard(cache_mutex_);
    if (!cache_.empty() && cache_version_ == version) {
      return cache_;
    }
  }

  HttpResponse resp = session_->get_raw(std::string(CATALOG_PATH) + "?version=" + version);
  if (!resp.transport_ok) {
    LOG_WARNING("Failed to fetch alias mappings: %s", resp.error.c_str());
    return AliasMapping();
  }
  if (resp.status != 200) {
    LOG_WARNING("get-alias returned status %ld", resp.status);
    return AliasMapping();
  }

  nlohmann::json body;
  try {
    body = nlohmann::json::parse(resp.body);
  } catch (const nlohmann::json::parse_error &e) {
    LOG_WARNING("Failed to decode alias mappings: %s", e.what());
    return AliasMapping();
  }

  AliasCatalog catalog = parse_catalog(body);
  AliasMapping mapping = build_mapping(catalog.resources);
  if (mapping.empty()) {
    LOG_DEBUG("No usable alias entries (shape: %s)", alias_catalog_shape_to_string(catalog.shape));
    return mapping;
  }

  LOG_DEBUG("Loaded %zu alias mappings from server (shape: %s)", mapping.size(),
            alias_catalog_shape_to_string(catalog.shape));
  size_t found = count_wanted(mapping);
  LOG_DEBUG("Aliases found: %zu, missing: %zu", found, wanted_aliases().size() - found);

  std::lock_guard<std::mutex> guard(cache_mutex_);
  cache_ = mapping;
  cache_version_ = version;
  return mapping;
}

}  // namespace VinFastCloud
