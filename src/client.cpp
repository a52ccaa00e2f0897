#ifndef VINFAST_LOG_TAG
#define VINFAST_LOG_TAG "VinFastCloud::Client"
#endif

#include "client.h"

#include <utility>

#include "defs.h"
#include "errors.h"
#include "vf_utils.h"

namespace VinFastCloud {

bool AllData::has_error(VinFastCloud_Status_E status) const {
  for (const auto &error : errors) {
    if (error.status() == status) {
      return true;
    }
  }
  return false;
}

nlohmann::json AllData::to_json() const {
  nlohmann::json out = {
      {"vehicles", vehicles},
      {"profile", profile},
      {"locations", locations},
      {"telemetry", telemetry ? snapshot_to_json(*telemetry) : nlohmann::json()},
  };
  nlohmann::json error_list = nlohmann::json::array();
  for (const auto &error : errors) {
    error_list.push_back(error.to_string());
  }
  out["errors"] = error_list;
  return out;
}

Client::Client(std::shared_ptr<HttpAdapter> http, ClientConfig config)
    : session_(std::make_shared<Session>(std::move(http), std::move(config))),
      alias_resolver_(std::make_unique<AliasResolver>(session_)) {}

ApiResult<> Client::authenticate(const std::string &email, const std::string &password) {
  return session_->authenticate(email, password);
}

ApiResult<nlohmann::json> Client::get_vehicles() {
  auto result = session_->request(HttpMethod::GET, VEHICLES_PATH);
  if (result.is_error()) {
    return result;
  }

  nlohmann::json vehicles = result.value().is_array() ? result.value() : nlohmann::json::array();
  if (!vehicles.empty() && vehicles[0].is_object()) {
    const auto &first = vehicles[0];
    std::string vin = first.contains("vinCode") && !first["vinCode"].is_null()
                          ? json_scalar_to_string(first["vinCode"])
                          : std::string();
    std::string user_id = first.contains("userId") && !first["userId"].is_null()
                              ? json_scalar_to_string(first["userId"])
                              : std::string();
    if (!vin.empty()) {
      session_->set_identity_if_unset(vin, user_id);
    }
  }
  return ApiResult<nlohmann::json>::success(std::move(vehicles));
}

ApiResult<nlohmann::json> Client::get_profile() {
  auto result = session_->request(HttpMethod::GET, PROFILE_PATH);
  if (result.is_error()) {
    return result;
  }
  if (!result.value().is_object()) {
    return ApiResult<nlohmann::json>::success(nlohmann::json::object());
  }
  return result;
}

ApiResult<nlohmann::json> Client::get_locations() {
  auto result = session_->request(HttpMethod::GET, LOCATIONS_PATH);
  if (result.is_error()) {
    return result;
  }
  if (!result.value().is_array()) {
    return ApiResult<nlohmann::json>::success(nlohmann::json::array());
  }
  return result;
}

ApiResult<std::unique_ptr<TelemetrySnapshot>> Client::get_telemetry() {
  using Result = ApiResult<std::unique_ptr<TelemetrySnapshot>>;

  if (session_->vin().empty()) {
    LOG_INFO("No VIN available, skipping telemetry fetch");
    return Result::success(nullptr);
  }

  AliasMapping mapping = alias_resolver_->resolve(session_->config().alias_version);
  TelemetryRequest request = TelemetryDecoder::build_request(mapping);
  if (request.resources.empty()) {
    LOG_WARNING("No telemetry resource paths available");
    return Result::success(nullptr);
  }

  LOG_DEBUG("Requesting %zu telemetry resources", request.resources.size());
  auto response = session_->request(HttpMethod::POST, TelemetryDecoder::PING_PATH, request.to_json());
  if (response.is_error()) {
    LOG_DEBUG("Telemetry request failed: %s", response.error().to_string().c_str());
    return Result::error(response.release_error());
  }

  const nlohmann::json &raw = response.value();
  if (raw.is_null() || raw.empty()) {
    LOG_DEBUG("No data in telemetry response");
    return Result::success(nullptr);
  }

  auto snapshot = std::make_unique<TelemetrySnapshot>(TelemetryDecoder::decode(raw, request.path_to_alias));
  return Result::success(std::move(snapshot));
}

AllData Client::get_all_data() {
  AllData data;

  auto vehicles = get_vehicles();
  if (vehicles.is_success()) {
    data.vehicles = std::move(vehicles.value());
  } else {
    LOG_WARNING("Failed to get vehicles: %s", vehicles.error().to_string().c_str());
    data.errors.push_back(vehicles.error());
  }

  auto profile = get_profile();
  if (profile.is_success()) {
    data.profile = std::move(profile.value());
  } else {
    LOG_WARNING("Failed to get profile: %s", profile.error().to_string().c_str());
    data.errors.push_back(profile.error());
  }

  auto telemetry = get_telemetry();
  if (telemetry.is_success()) {
    data.telemetry = std::move(telemetry.value());
  } else {
    LOG_DEBUG("Telemetry unavailable: %s", telemetry.error().to_string().c_str());
    data.errors.push_back(telemetry.error());
  }

  auto locations = get_locations();
  if (locations.is_success()) {
    data.locations = std::move(locations.value());
  } else {
    LOG_DEBUG("Locations unavailable: %s", locations.error().to_string().c_str());
    data.errors.push_back(locations.error());
  }

  return data;
}

}  // namespace VinFastCloud
