#pragma once

#include <cstdint>
#include <string>

namespace VinFastCloud {

/**
 * @brief Endpoint and client-identification settings for one cloud account.
 *
 * Defaults target the US production tenant.
 */
struct ClientConfig {
  // OAuth2 identity provider
  std::string auth_domain = "vinfast-us-prod.us.auth0.com";
  std::string client_id = "xhGY7XKDFSk1Q22rxidvwujfz0EPAbUP";
  std::string audience = "https://vinfast-us-prod.us.auth0.com/api/v2/";
  std::string scope = "offline_access openid profile email";

  std::string api_base = "https://mobile.connected-car.vinfastauto.us";
  std::string pairing_base = "https://ccarapi.vinfast.com";

  // Client identification headers
  std::string service_name = "CAPP";
  std::string app_version = "1.10.3";
  std::string device_platform = "HomeAssistant";
  std::string device_family = "Integration";
  std::string device_os_version = "1.0";
  std::string device_locale = "en-US";
  std::string timezone = "America/New_York";
  std::string device_identifier = "vinfast-cloud-client";

  long request_timeout_seconds = 30;
  long command_timeout_seconds = 60;

  std::string alias_version = "1.0";

  std::string token_url() const { return "https://" + auth_domain + "/oauth/token"; }
};

struct PollConfig {
  // Empty disables charging-aware polling
  std::string charger_entity = "sensor.charger_status_connector";
  std::string charging_state = "Charging";
  uint32_t normal_interval_seconds = 14400;
  uint32_t charging_interval_seconds = 300;
};

struct Credentials {
  std::string email;
  std::string password;
};

/**
 * @brief Populate configs from a JSON document.
 *
 * Recognised layout: {"client": {...}, "polling": {...}} using the camelCase field names
 * (authDomain, clientId, apiBase, requestTimeoutSeconds, chargerEntity, normalIntervalSeconds...).
 * Missing keys keep their current values.
 *
 * @return 0 on success, ERROR_JSON_DECODING for unparsable text, ERROR_INVALID_PARAMS for
 *         type mismatches or non-positive intervals/timeouts. Outputs are untouched on error.
 */
int load_config_from_json(const std::string &json_text, ClientConfig &client, PollConfig &poll);

}  // namespace VinFastCloud
