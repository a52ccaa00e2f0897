#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "session.h"

namespace VinFastCloud {

struct AliasEntry {
  std::string object_id;
  std::string instance_id;
  std::string resource_id;
  // Always "/{object_id}/{instance_id}/{resource_id}"
  std::string path;
  std::string name;
  std::string units;
  std::string type;
};

using AliasMapping = std::map<std::string, AliasEntry>;

/**
 * Which of the known catalog layouts a response used.
 */
enum class AliasCatalogShape {
  DATA_RESOURCES,  // {"data": {"resources": [...]}}
  DATA_LIST,       // {"data": [...]}
  RESOURCES,       // {"resources": [...]}
  BARE_LIST,       // [...]
  UNRECOGNIZED
};

struct AliasCatalog {
  AliasCatalogShape shape = AliasCatalogShape::UNRECOGNIZED;
  nlohmann::json resources = nlohmann::json::array();
};

const char *alias_catalog_shape_to_string(AliasCatalogShape shape);

/**
 * @brief Fetches and caches the alias to resource-path mapping.
 *
 * Resolution is advisory: any failure yields an empty mapping and the telemetry path falls
 * back to the static resource table.
 */
class AliasResolver {
 public:
  static constexpr const char *CATALOG_PATH = "/modelmgmt/api/v2/vehicle-model/mobile-app/vehicle/get-alias";

  explicit AliasResolver(std::shared_ptr<Session> session);

  /**
   * @brief Mapping for a schema version.
   *
   * A cached mapping for the same version is returned without a network call. Only non-empty
   * mappings are cached.
   */
  AliasMapping resolve(const std::string &version);

  /**
   * @brief Try each known catalog layout in order: data.resources, data as list,
   * top-level resources, bare list.
   */
  static AliasCatalog parse_catalog(const nlohmann::json &body);

  /**
   * @brief Build a mapping from catalog resource entries.
   *
   * Entries without an alias or object id are skipped; instance and resource ids default to "0".
   * Ids may be strings or integers.
   */
  static AliasMapping build_mapping(const nlohmann::json &resources);

  // Telemetry signals requested on each poll, in request order
  static const std::vector<std::string> &wanted_aliases();

  // How many wanted aliases the mapping covers (diagnostics only)
  static size_t count_wanted(const AliasMapping &mapping);

 private:
  std::shared_ptr<Session> session_;

  mutable std::mutex cache_mutex_;
  AliasMapping cache_;
  std::string cache_version_;
};

}  // namespace VinFastCloud
