#pragma once

#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "adapters.h"
#include "api_error.h"
#include "client.h"
#include "command_signer.h"
#include "config.h"
#include "pairing_engine.h"

namespace VinFastCloud {

/**
 * What start_pairing() leaves behind for complete_pairing().
 */
struct PendingPairing {
  std::string session_id;
  std::string device_id;
  std::string encrypted_csr_b64;
  std::string seed_b64;
};

/**
 * @brief One vehicle on one account: cloud client, pairing and remote commands.
 *
 * Paired key material is persisted through the StorageAdapter under STORAGE_KEY and restored
 * on construction.
 */
class Vehicle {
 public:
  static constexpr const char *STORAGE_KEY = "pairing_keys";

  Vehicle(std::shared_ptr<HttpAdapter> http, std::shared_ptr<StorageAdapter> storage,
          std::shared_ptr<ClockAdapter> clock, ClientConfig config = ClientConfig());

  // Delete copy constructor and assignment operator
  Vehicle(const Vehicle &) = delete;
  Vehicle &operator=(const Vehicle &) = delete;

  /**
   * @brief Run the pairing ceremony up to the OTP.
   *
   * Parses and validates the QR against the session's vehicle, generates the key pair and CSR,
   * prepares the enrollment payload and asks the backend to send the OTP. Requires an
   * authenticated session with a known VIN. An empty device name uses the configured platform.
   * Any unfinished attempt is cancelled first.
   */
  ApiResult<> start_pairing(const std::string &qr_content, const std::string &device_name = "",
                            const std::string &phone = "", const std::string &email = "");

  // Ask for the OTP again while it is pending
  ApiResult<> resend_otp(const std::string &phone = "", const std::string &email = "");

  /**
   * @brief Submit the OTP, then export and persist the key material.
   */
  ApiResult<> complete_pairing(const std::string &otp, const std::string &phone = "", const std::string &email = "");

  // Abandon an unfinished attempt; existing key material is kept
  void cancel_pairing();

  // Drop key material and its persisted copy
  void unpair();

  bool is_paired() const { return pairing_->is_paired(); }

  /**
   * @brief Sign and dispatch a control command.
   * @return ERROR_NOT_PAIRED without key material, ERROR_INVALID_PARAMS for unknown aliases,
   *         ERROR_PROTOCOL when the backend did not accept the command
   */
  ApiResult<> send_command(const std::string &alias, const nlohmann::json &value);

  ApiResult<> set_climate(bool enable);
  ApiResult<> set_climate_temperature(double celsius);
  ApiResult<> lock();
  ApiResult<> unlock();
  ApiResult<> honk_horn();
  ApiResult<> flash_lights();

  Client &client() { return *client_; }
  PairingEngine &pairing() { return *pairing_; }

 private:
  std::shared_ptr<StorageAdapter> storage_adapter_;
  ClientConfig config_;
  std::unique_ptr<Client> client_;
  std::unique_ptr<PairingEngine> pairing_;
  std::unique_ptr<CommandSigner> signer_;

  std::mutex pending_mutex_;
  std::unique_ptr<PendingPairing> pending_;

  void load_keys_from_storage_();
  bool persist_keys_(const PairingKeyMaterial &material);
};

}  // namespace VinFastCloud
