#ifndef VINFAST_LOG_TAG
#define VINFAST_LOG_TAG "VinFastCloud::Config"
#endif

#include "config.h"

#include <nlohmann/json.hpp>

#include "defs.h"
#include "errors.h"

namespace VinFastCloud {

namespace {

ClientConfig parse_client(const nlohmann::json &client_json, const ClientConfig &defaults) {
  ClientConfig cfg = defaults;
  cfg.auth_domain = client_json.value("authDomain", cfg.auth_domain);
  cfg.client_id = client_json.value("clientId", cfg.client_id);
  cfg.audience = client_json.value("audience", cfg.audience);
  cfg.scope = client_json.value("scope", cfg.scope);
  cfg.api_base = client_json.value("apiBase", cfg.api_base);
  cfg.pairing_base = client_json.value("pairingBase", cfg.pairing_base);
  cfg.service_name = client_json.value("serviceName", cfg.service_name);
  cfg.app_version = client_json.value("appVersion", cfg.app_version);
  cfg.device_platform = client_json.value("devicePlatform", cfg.device_platform);
  cfg.device_family = client_json.value("deviceFamily", cfg.device_family);
  cfg.device_os_version = client_json.value("deviceOsVersion", cfg.device_os_version);
  cfg.device_locale = client_json.value("deviceLocale", cfg.device_locale);
  cfg.timezone = client_json.value("timezone", cfg.timezone);
  cfg.device_identifier = client_json.value("deviceIdentifier", cfg.device_identifier);
  cfg.request_timeout_seconds = client_json.value("requestTimeoutSeconds", cfg.request_timeout_seconds);
  cfg.command_timeout_seconds = client_json.value("commandTimeoutSeconds", cfg.command_timeout_seconds);
  cfg.alias_version = client_json.value("aliasVersion", cfg.alias_version);
  return cfg;
}

PollConfig parse_polling(const nlohmann::json &poll_json, const PollConfig &defaults) {
  PollConfig cfg = defaults;
  cfg.charger_entity = poll_json.value("chargerEntity", cfg.charger_entity);
  cfg.charging_state = poll_json.value("chargingState", cfg.charging_state);
  cfg.normal_interval_seconds = poll_json.value("normalIntervalSeconds", cfg.normal_interval_seconds);
  cfg.charging_interval_seconds = poll_json.value("chargingIntervalSeconds", cfg.charging_interval_seconds);
  return cfg;
}

}  // namespace

int load_config_from_json(const std::string &json_text, ClientConfig &client, PollConfig &poll) {
  nlohmann::json root;
  try {
    root = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error &e) {
    LOG_ERROR("Config is not valid JSON: %s", e.what());
    return VinFastCloud_Status_E_ERROR_JSON_DECODING;
  }

  if (!root.is_object()) {
    LOG_ERROR("Config root must be an object");
    return VinFastCloud_Status_E_ERROR_INVALID_PARAMS;
  }

  ClientConfig parsed_client = client;
  PollConfig parsed_poll = poll;
  try {
    if (root.contains("client")) {
      parsed_client = parse_client(root.at("client"), client);
    }
    if (root.contains("polling")) {
      parsed_poll = parse_polling(root.at("polling"), poll);
    }
  } catch (const nlohmann::json::exception &e) {
    LOG_ERROR("Invalid config value: %s", e.what());
    return VinFastCloud_Status_E_ERROR_INVALID_PARAMS;
  }

  if (parsed_client.request_timeout_seconds <= 0 || parsed_client.command_timeout_seconds <= 0) {
    LOG_ERROR("Timeouts must be positive");
    return VinFastCloud_Status_E_ERROR_INVALID_PARAMS;
  }
  if (parsed_poll.normal_interval_seconds == 0 || parsed_poll.charging_interval_seconds == 0) {
    LOG_ERROR("Polling intervals must be positive");
    return VinFastCloud_Status_E_ERROR_INVALID_PARAMS;
  }

  client = parsed_client;
  poll = parsed_poll;
  return VinFastCloud_Status_E_OK;
}

}  // namespace VinFastCloud
