#ifndef VINFAST_LOG_TAG
#define VINFAST_LOG_TAG "VinFastCloud::Command"
#endif

#include "command_signer.h"

#include <array>
#include <utility>
#include <vector>

#include "crypto_context.h"
#include "defs.h"
#include "errors.h"
#include "vf_utils.h"

namespace VinFastCloud {

nlohmann::json SignedCommand::to_json() const {
  return {
      {"message_name", message_name},
      {"message_content", message_content},
      {"sess_id", session_id},
      {"timestamp", timestamp},
      {"signature", signature},
      {"tag", nullptr},
      {"user_id", user_id},
      {"isMasterProfile", is_master_profile},
      {"signature2", signature2},
      {"wakeUpTimeOut", wake_up_timeout_ms},
  };
}

CommandSigner::CommandSigner(std::shared_ptr<HttpAdapter> http, std::shared_ptr<ClockAdapter> clock,
                             ClientConfig config)
    : http_(std::move(http)), clock_(std::move(clock)), config_(std::move(config)) {}

int64_t CommandSigner::next_timestamp_ms_() {
  std::lock_guard<std::mutex> guard(timestamp_mutex_);
  int64_t now = clock_->now_ms();
  if (now <= last_timestamp_ms_) {
    now = last_timestamp_ms_ + 1;
  }
  last_timestamp_ms_ = now;
  return now;
}

std::string CommandSigner::signing_input(const std::string &timestamp, const std::string &message_content_b64) {
  return timestamp + message_content_b64;
}

std::string CommandSigner::hash_user_id(const std::string &user_id) {
  std::array<uint8_t, CryptoUtils::SHA256_SIZE> digest{};
  if (CryptoUtils::sha256_hash(reinterpret_cast<const uint8_t *>(user_id.data()), user_id.size(), digest.data()) !=
      VinFastCloud_Status_E_OK) {
    return "";
  }
  return base64_encode(digest.data(), digest.size());
}

ApiResult<SignedCommand> CommandSigner::sign(const SigningKeys &keys, const std::string &message_name,
                                             const nlohmann::json &message_content, const std::string &user_id,
                                             const std::string &session_id) {
  if (!keys.is_complete()) {
    return ApiResult<SignedCommand>::error(ApiError::pairing("Not paired - cannot sign commands"));
  }

  SignedCommand cmd;
  cmd.message_name = message_name;
  cmd.session_id = session_id;
  cmd.message_content = base64_encode(to_compact_json(message_content));
  cmd.timestamp = std::to_string(next_timestamp_ms_());

  const std::string input = signing_input(cmd.timestamp, cmd.message_content);
  const auto *input_bytes = reinterpret_cast<const uint8_t *>(input.data());

  std::vector<uint8_t> rsa_signature;
  if (keys.crypto->sign_sha256(input_bytes, input.size(), rsa_signature) != VinFastCloud_Status_E_OK) {
    return ApiResult<SignedCommand>::error(ApiError::crypto("RSA signing failed for " + message_name));
  }
  cmd.signature = base64_encode(rsa_signature);

  std::array<uint8_t, CryptoUtils::SHA256_SIZE> mac{};
  if (CryptoUtils::hmac_sha256(keys.shared_key.data(), keys.shared_key.size(), input_bytes, input.size(),
                               mac.data()) != VinFastCloud_Status_E_OK) {
    return ApiResult<SignedCommand>::error(ApiError::crypto("HMAC signing failed for " + message_name));
  }
  cmd.signature2 = base64_encode(mac.data(), mac.size());

  cmd.user_id = hash_user_id(user_id);
  if (cmd.user_id.empty()) {
    return ApiResult<SignedCommand>::error(ApiError::crypto("Failed to hash user id"));
  }

  LOG_DEBUG("Signed %s at %s", message_name.c_str(), cmd.timestamp.c_str());
  return ApiResult<SignedCommand>::success(std::move(cmd));
}

bool CommandSigner::dispatch(const std::string &access_token, const SignedCommand &command) {
  HttpRequest req;
  req.method = HttpMethod::POST;
  req.url = config_.pairing_base + COMMAND_PATH;
  req.headers = {
      {"Authorization", "Bearer " + access_token},
      {"Content-Type", "application/json"},
      {"Accept", "application/json"},
  };
  req.body = command.to_json().dump();
  req.timeout_seconds = config_.command_timeout_seconds;

  HttpResponse resp = http_->perform(req);
  if (!resp.transport_ok) {
    LOG_ERROR("Command connection error: %s", resp.error.c_str());
    return false;
  }
  if (resp.status != 200) {
    LOG_ERROR("Command %s failed: %ld - %s", command.message_name.c_str(), resp.status, resp.body.c_str());
    return false;
  }

  LOG_INFO("Command sent successfully: %s", command.message_name.c_str());
  return true;
}

}  // namespace VinFastCloud
