#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "alias_resolver.h"

namespace VinFastCloud {

struct ResourceTriple {
  std::string object_id;
  std::string instance_id;
  std::string resource_id;

  nlohmann::json to_json() const {
    return {{"objectId", object_id}, {"instanceId", instance_id}, {"resourceId", resource_id}};
  }
};

struct TelemetryRequest {
  std::vector<ResourceTriple> resources;
  // Canonical path -> alias. Empty when built from the static table.
  std::map<std::string, std::string> path_to_alias;
  bool from_fallback = false;

  // The ping endpoint takes a bare array, not an object
  nlohmann::json to_json() const;
};

/**
 * A decoded telemetry value: a double when the vendor value parses as a number, otherwise
 * the original text.
 */
struct TelemetryValue {
  bool is_numeric = false;
  double number = 0.0;
  std::string text;

  static TelemetryValue from_number(double value);
  static TelemetryValue from_text(const std::string &value);

  nlohmann::json to_json() const;
  bool operator==(const TelemetryValue &other) const;
};

// Friendly key -> value. Rebuilt on every poll; a missing key means "not reported this cycle".
using TelemetrySnapshot = std::map<std::string, TelemetryValue>;

nlohmann::json snapshot_to_json(const TelemetrySnapshot &snapshot);

class TelemetryDecoder {
 public:
  static constexpr const char *PING_PATH = "/ccaraccessmgmt/api/v1/telemetry/app/ping";

  /**
   * @brief Build the batched read for one poll.
   *
   * With a non-empty mapping, one triple per wanted alias present, in wanted-alias order.
   * With an empty mapping, the static fallback table.
   */
  static TelemetryRequest build_request(const AliasMapping &mapping);

  /**
   * @brief Decode a ping response's data array.
   *
   * Items without a deviceKey or with a null value are skipped. Later duplicates overwrite
   * earlier ones. Values stay in vendor units.
   */
  static TelemetrySnapshot decode(const nlohmann::json &raw_items,
                                  const std::map<std::string, std::string> &path_to_alias);

  /**
   * @brief "34183_00001_00003" -> "/34183/1/3".
   * @return false if the key is not three numeric segments.
   */
  static bool device_key_to_path(const std::string &device_key, std::string &path);

  // Alias -> friendly key; unmapped aliases are lower-cased
  static std::string friendly_key(const std::string &alias);

  static const std::vector<std::string> &fallback_paths();
  static bool parse_path(const std::string &path, ResourceTriple &triple);

  static TelemetryValue coerce_value(const nlohmann::json &value);
};

}  // namespace VinFastCloud
