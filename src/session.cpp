#ifndef VINFAST_LOG_TAG
#define VINFAST_LOG_TAG "VinFastCloud::Session"
#endif

#include "session.h"

#include <utility>

#include "defs.h"
#include "errors.h"

namespace VinFastCloud {

Session::Session(std::shared_ptr<HttpAdapter> http, ClientConfig config)
    : http_(std::move(http)), config_(std::move(config)) {}

Session::HeaderMap Session::json_headers() {
  return {{"Content-Type", "application/json"}, {"Accept", "application/json"}};
}

ApiResult<> Session::authenticate(const std::string &email, const std::string &password) {
  if (email.empty() || password.empty()) {
    return ApiResult<>::error(
        std::make_unique<ApiError>(VinFastCloud_Status_E_ERROR_AUTH, "Email and password are required"));
  }

  nlohmann::json payload = {
      {"client_id", config_.client_id}, {"audience", config_.audience}, {"grant_type", "password"},
      {"scope", config_.scope},         {"username", email},            {"password", password},
  };

  HttpRequest req;
  req.method = HttpMethod::POST;
  req.url = config_.token_url();
  req.headers = json_headers();
  req.body = payload.dump();
  req.timeout_seconds = config_.request_timeout_seconds;

  HttpResponse resp = http_->perform(req);
  if (!resp.transport_ok) {
    LOG_ERROR("Connection error during auth: %s", resp.error.c_str());
    return ApiResult<>::error(ApiError::transport("Authentication", resp.error));
  }
  if (resp.status == 401) {
    return ApiResult<>::error(ApiError::auth_failed("Authentication"));
  }
  if (resp.status != 200) {
    LOG_ERROR("Auth failed: %ld", resp.status);
    return ApiResult<>::error(ApiError::http_status_error("Authentication", static_cast<int>(resp.status), resp.body));
  }

  TokenState tokens;
  try {
    auto data = nlohmann::json::parse(resp.body);
    tokens.access_token = data.at("access_token").get<std::string>();
    if (data.contains("refresh_token") && data["refresh_token"].is_string()) {
      tokens.refresh_token = data["refresh_token"].get<std::string>();
    }
  } catch (const nlohmann::json::exception &e) {
    LOG_ERROR("Unexpected token response: %s", e.what());
    return ApiResult<>::error(ApiError::malformed("Authentication"));
  }

  set_tokens(tokens);
  LOG_DEBUG("Authentication successful");
  return ApiResult<>::success();
}

bool Session::refresh() { return refresh_from_(access_token()); }

bool Session::refresh_from_(const std::string &stale_access_token) {
  std::lock_guard<std::mutex> refresh_guard(refresh_mutex_);

  std::string refresh_token;
  {
    std::lock_guard<std::mutex> guard(state_mutex_);
    if (tokens_.access_token != stale_access_token && tokens_.has_access_token()) {
      // Someone else refreshed while we waited for the lock
      LOG_DEBUG("Token already refreshed by a concurrent request");
      return true;
    }
    if (!tokens_.has_refresh_token()) {
      return false;
    }
    refresh_token = tokens_.refresh_token;
  }

  nlohmann::json payload = {
      {"client_id", config_.client_id},
      {"grant_type", "refresh_token"},
      {"refresh_token", refresh_token},
  };

  HttpRequest req;
  req.method = HttpMethod::POST;
  req.url = config_.token_url();
  req.headers = json_headers();
  req.body = payload.dump();
  req.timeout_seconds = config_.request_timeout_seconds;

  HttpResponse resp = http_->perform(req);
  if (!resp.transport_ok) {
    LOG_ERROR("Token refresh failed: %s", resp.error.c_str());
    return false;
  }
  if (resp.status != 200) {
    LOG_WARNING("Token refresh rejected with status %ld", resp.status);
    return false;
  }

  TokenState tokens;
  try {
    auto data = nlohmann::json::parse(resp.body);
    tokens.access_token = data.at("access_token").get<std::string>();
    tokens.refresh_token = refresh_token;
    if (data.contains("refresh_token") && data["refresh_token"].is_string()) {
      tokens.refresh_token = data["refresh_token"].get<std::string>();
    }
  } catch (const nlohmann::json::exception &e) {
    LOG_ERROR("Token refresh failed: %s", e.what());
    return false;
  }

  set_tokens(tokens);
  LOG_DEBUG("Access token refreshed");
  return true;
}

Session::HeaderMap Session::build_headers(const std::string &vin, const std::string &user_id) const {
  HeaderMap headers = json_headers();
  headers["Authorization"] = "Bearer " + access_token();
  headers["x-service-name"] = config_.service_name;
  headers["x-app-version"] = config_.app_version;
  headers["x-device-platform"] = config_.device_platform;
  headers["x-device-family"] = config_.device_family;
  headers["x-device-os-version"] = config_.device_os_version;
  headers["x-device-locale"] = config_.device_locale;
  headers["x-timezone"] = config_.timezone;
  headers["x-device-identifier"] = config_.device_identifier;

  if (!vin.empty()) {
    headers[HEADER_VIN] = vin;
  }
  if (!user_id.empty()) {
    headers[HEADER_PLAYER] = user_id;
  }
  return headers;
}

Session::HeaderMap Session::build_headers() const {
  VehicleIdentity id = identity();
  return build_headers(id.vin, id.user_id);
}

bool Session::is_success_code_(const nlohmann::json &code) {
  if (!code.is_number()) {
    return false;
  }
  if (code.is_number_float()) {
    auto value = code.get<double>();
    return value == 0.0 || value == 200000.0;
  }
  auto value = code.get<long long>();
  return value == 0 || value == 200000;
}

ApiResult<nlohmann::json> Session::request(HttpMethod method, const std::string &path, const nlohmann::json &body) {
  const std::string token_used = access_token();

  HttpRequest req;
  req.method = method;
  req.url = config_.api_base + path;
  req.headers = build_headers();
  if (!body.is_null()) {
    req.body = body.dump();
  }
  req.timeout_seconds = config_.request_timeout_seconds;

  HttpResponse resp = http_->perform(req);
  if (!resp.transport_ok) {
    LOG_ERROR("API request failed: %s %s", path.c_str(), resp.error.c_str());
    return ApiResult<nlohmann::json>::error(ApiError::transport(path, resp.error));
  }

  if (resp.status == 401) {
    if (refresh_from_(token_used)) {
      return ApiResult<nlohmann::json>::error(ApiError::retry_after_refresh());
    }
    return ApiResult<nlohmann::json>::error(ApiError::auth_expired());
  }

  if (resp.status != 200) {
    return ApiResult<nlohmann::json>::error(ApiError::http_status_error(path, static_cast<int>(resp.status), resp.body));
  }

  nlohmann::json envelope;
  try {
    envelope = nlohmann::json::parse(resp.body);
  } catch (const nlohmann::json::parse_error &e) {
    LOG_DEBUG("Undecodable body from %s: %s", path.c_str(), e.what());
    return ApiResult<nlohmann::json>::error(ApiError::malformed(path));
  }
  if (!envelope.is_object()) {
    return ApiResult<nlohmann::json>::error(ApiError::malformed(path));
  }

  auto code = envelope.find("code");
  if (code == envelope.end() || !is_success_code_(*code)) {
    std::string message = "Unknown error";
    auto msg = envelope.find("message");
    if (msg != envelope.end() && msg->is_string()) {
      message = msg->get<std::string>();
    }
    return ApiResult<nlohmann::json>::error(ApiError::application(message));
  }

  auto data = envelope.find("data");
  if (data == envelope.end()) {
    return ApiResult<nlohmann::json>::success(nlohmann::json());
  }
  return ApiResult<nlohmann::json>::success(*data);
}

HttpResponse Session::get_raw(const std::string &path) {
  HttpRequest req;
  req.method = HttpMethod::GET;
  req.url = config_.api_base + path;
  req.headers = build_headers();
  req.timeout_seconds = config_.request_timeout_seconds;
  return http_->perform(req);
}

bool Session::is_authenticated() const {
  std::lock_guard<std::mutex> guard(state_mutex_);
  return tokens_.has_access_token();
}

std::string Session::access_token() const {
  std::lock_guard<std::mutex> guard(state_mutex_);
  return tokens_.access_token;
}

void Session::set_tokens(const TokenState &tokens) {
  std::lock_guard<std::mutex> guard(state_mutex_);
  tokens_ = tokens;
}

VehicleIdentity Session::identity() const {
  std::lock_guard<std::mutex> guard(state_mutex_);
  return identity_;
}

std::string Session::vin() const {
  std::lock_guard<std::mutex> guard(state_mutex_);
  return identity_.vin;
}

std::string Session::user_id() const {
  std::lock_guard<std::mutex> guard(state_mutex_);
  return identity_.user_id;
}

bool Session::set_identity_if_unset(const std::string &vin, const std::string &user_id) {
  std::lock_guard<std::mutex> guard(state_mutex_);
  if (!identity_.vin.empty()) {
    return false;
  }
  identity_.vin = vin;
  identity_.user_id = user_id;
  LOG_DEBUG("Vehicle identity set: %s", vin.c_str());
  return true;
}

}  // namespace VinFastCloud
