#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "adapters.h"
#include "api_error.h"
#include "config.h"
#include "pairing_engine.h"

namespace VinFastCloud {

/**
 * A fully formed remote command. Built per call; never cached or replayed.
 */
struct SignedCommand {
  std::string message_name;
  std::string message_content;  // base64 of the compact JSON content
  std::string session_id;
  std::string timestamp;  // decimal milliseconds since epoch
  std::string signature;  // base64 RSA PKCS#1 v1.5 SHA-256
  std::string user_id;    // base64 SHA-256 of the user id
  std::string signature2;  // base64 HMAC-SHA256 with the share key
  bool is_master_profile = true;
  int wake_up_timeout_ms = 60000;

  nlohmann::json to_json() const;
};

class SystemClock : public ClockAdapter {
 public:
  int64_t now_ms() override {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
  }
};

/**
 * @brief Signs and dispatches remote commands with paired key material.
 *
 * Both signatures cover timestamp ++ base64(content). Timestamps are strictly increasing per
 * signer even if the clock stalls or steps back.
 */
class CommandSigner {
 public:
  static constexpr const char *COMMAND_PATH = "/ccaraccessmgmt/api/v2/remote/app/command";

  CommandSigner(std::shared_ptr<HttpAdapter> http, std::shared_ptr<ClockAdapter> clock,
                ClientConfig config = ClientConfig());

  /**
   * @brief Build a SignedCommand.
   * @return ERROR_PAIRING when the private key or share key is missing
   */
  ApiResult<SignedCommand> sign(const SigningKeys &keys, const std::string &message_name,
                                const nlohmann::json &message_content, const std::string &user_id,
                                const std::string &session_id);

  /**
   * @brief POST the command with the command timeout.
   * @return true only on HTTP 200. Failures are logged, never raised.
   */
  bool dispatch(const std::string &access_token, const SignedCommand &command);

  // Payload that gets signed: timestamp bytes followed by the base64 content bytes
  static std::string signing_input(const std::string &timestamp, const std::string &message_content_b64);

  static std::string hash_user_id(const std::string &user_id);

 private:
  std::shared_ptr<HttpAdapter> http_;
  std::shared_ptr<ClockAdapter> clock_;
  ClientConfig config_;

  std::mutex timestamp_mutex_;
  int64_t last_timestamp_ms_ = 0;

  int64_t next_timestamp_ms_();
};

}  // namespace VinFastCloud
