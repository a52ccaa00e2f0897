#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "adapters.h"
#include "alias_resolver.h"
#include "api_error.h"
#include "config.h"
#include "session.h"
#include "telemetry_decoder.h"

namespace VinFastCloud {

/**
 * Best-effort aggregate of one poll. A failed sub-fetch leaves its member null (telemetry
 * nullptr) and appends to errors; it never aborts the others.
 */
struct AllData {
  nlohmann::json vehicles;
  nlohmann::json profile;
  nlohmann::json locations;
  std::unique_ptr<TelemetrySnapshot> telemetry;
  std::vector<ApiError> errors;

  bool has_error(VinFastCloud_Status_E status) const;
  nlohmann::json to_json() const;
};

/**
 * @brief Main client class for the vendor cloud API
 *
 * Wraps the account, alias and telemetry endpoints on top of one Session.
 */
class Client {
 public:
  static constexpr const char *VEHICLES_PATH = "/ccarusermgnt/api/v1/user-vehicle";
  static constexpr const char *PROFILE_PATH = "/ccarusermgnt/api/v1/auth0/account/profile";
  static constexpr const char *LOCATIONS_PATH = "/ccarusermgnt/api/v1/location-favorite";

  Client(std::shared_ptr<HttpAdapter> http, ClientConfig config = ClientConfig());

  // Delete copy constructor and assignment operator
  Client(const Client &) = delete;
  Client &operator=(const Client &) = delete;

  ApiResult<> authenticate(const std::string &email, const std::string &password);

  /**
   * @brief List the account's vehicles.
   *
   * The first entry of the first non-empty listing fixes the session's VIN and user id.
   */
  ApiResult<nlohmann::json> get_vehicles();

  ApiResult<nlohmann::json> get_profile();
  ApiResult<nlohmann::json> get_locations();

  /**
   * @brief One telemetry ping.
   *
   * Absent (nullptr) when no VIN is known yet, no resources could be requested or the server
   * returned no values.
   */
  ApiResult<std::unique_ptr<TelemetrySnapshot>> get_telemetry();

  // Vehicles, profile, telemetry and locations, fetched in that order and independently
  AllData get_all_data();

  std::string vin() const { return session_->vin(); }
  std::string user_id() const { return session_->user_id(); }

  std::shared_ptr<Session> session() const { return session_; }
  AliasResolver &alias_resolver() { return *alias_resolver_; }

 private:
  std::shared_ptr<Session> session_;
  std::unique_ptr<AliasResolver> alias_resolver_;
};

}  // namespace VinFastCloud
