#ifndef VINFAST_CLOUD_SESSION_H
#define VINFAST_CLOUD_SESSION_H

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "adapters.h"
#include "api_error.h"
#include "config.h"

namespace VinFastCloud {

struct TokenState {
  std::string access_token;
  // Empty when the identity provider did not issue one; refresh is then impossible
  std::string refresh_token;

  bool has_access_token() const { return !access_token.empty(); }
  bool has_refresh_token() const { return !refresh_token.empty(); }
};

struct VehicleIdentity {
  std::string vin;
  std::string user_id;
};

/**
 * @brief Token lifecycle and authenticated request wrapper for one cloud account.
 *
 * Owns the OAuth tokens and the vehicle identity that scopes every request. Token mutation is
 * serialized and refresh is single-flight: callers that hit 401 together share one refresh
 * exchange.
 */
class Session {
 public:
  using HeaderMap = std::map<std::string, std::string>;

  static constexpr const char *HEADER_VIN = "x-vin-code";
  static constexpr const char *HEADER_PLAYER = "x-player-identifier";

  Session(std::shared_ptr<HttpAdapter> http, ClientConfig config = ClientConfig());

  // Delete copy constructor and assignment operator
  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  /**
   * @brief Password-grant token exchange.
   *
   * Fails with ERROR_AUTH on HTTP 401 and ERROR_PROTOCOL on any other non-200 status or
   * transport failure. Replaces both tokens on success.
   */
  ApiResult<> authenticate(const std::string &email, const std::string &password);

  /**
   * @brief Refresh-grant token exchange.
   * @return false if no refresh token is held or the exchange did not return a usable token.
   */
  bool refresh();

  /**
   * @brief Authenticated headers for the vendor API.
   *
   * Always carries the client-identification set and the bearer token. x-vin-code and
   * x-player-identifier are only added for non-empty arguments.
   */
  HeaderMap build_headers(const std::string &vin, const std::string &user_id) const;
  HeaderMap build_headers() const;

  /**
   * @brief Single authenticated call against the API base.
   *
   * On 401 exactly one refresh is attempted. A successful refresh yields
   * ERROR_RETRY_AFTER_REFRESH and the request is NOT resent; a failed one yields
   * ERROR_AUTH_EXPIRED. Other non-200 statuses and transport failures are ERROR_PROTOCOL.
   * A 200 whose envelope code is not numerically 0 or 200000 (integer or float) is ERROR_PROTOCOL with the server message.
   *
   * @param body JSON body for POST, null for none
   * @return The envelope's "data" member (null when absent)
   */
  ApiResult<nlohmann::json> request(HttpMethod method, const std::string &path,
                                    const nlohmann::json &body = nlohmann::json());

  /**
   * @brief Authenticated GET returning the raw exchange, without envelope checks or refresh.
   */
  HttpResponse get_raw(const std::string &path);

  bool is_authenticated() const;
  std::string access_token() const;
  void set_tokens(const TokenState &tokens);

  VehicleIdentity identity() const;
  std::string vin() const;
  std::string user_id() const;

  /**
   * @brief Record the vehicle identity if none is set yet.
   * @return true if the identity was set by this call.
   */
  bool set_identity_if_unset(const std::string &vin, const std::string &user_id);

  const ClientConfig &config() const { return config_; }
  std::shared_ptr<HttpAdapter> http() const { return http_; }

  static HeaderMap json_headers();

 private:
  std::shared_ptr<HttpAdapter> http_;
  ClientConfig config_;

  TokenState tokens_;
  VehicleIdentity identity_;
  mutable std::mutex state_mutex_;
  // Held for the whole refresh exchange
  std::mutex refresh_mutex_;

  bool refresh_from_(const std::string &stale_access_token);
  static bool is_success_code_(const nlohmann::json &code);
};

}  // namespace VinFastCloud

#endif  // VINFAST_CLOUD_SESSION_H
