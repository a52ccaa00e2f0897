#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "adapters.h"
#include "api_error.h"
#include "config.h"
#include "crypto_context.h"

namespace VinFastCloud {

enum class PairingState {
  IDLE,
  QR_PARSED,
  VALIDATED,
  KEYS_GENERATED,
  CSR_READY,
  ENCRYPTED_READY,
  OTP_TRIGGERED,
  PAIRED,
  FAILED
};

const char *pairing_state_to_string(PairingState state);

using QrParams = std::map<std::string, std::string>;

struct EncryptedCsr {
  std::string encrypted_csr_b64;
  std::string seed_b64;
};

/**
 * Durable output of a successful pairing, persisted by the host and re-imported verbatim.
 */
struct PairingKeyMaterial {
  std::string private_key_pem;
  std::string shared_key_b64;
  std::string session_id;

  bool empty() const { return private_key_pem.empty() && shared_key_b64.empty() && session_id.empty(); }

  nlohmann::json to_json() const;
  // Missing or non-string members are read as empty strings
  static PairingKeyMaterial from_json(const nlohmann::json &json);
};

/**
 * What the command signer needs: the RSA key and the HMAC share key.
 */
struct SigningKeys {
  std::shared_ptr<CryptoContext> crypto;
  std::vector<uint8_t> shared_key;
  std::string session_id;

  bool is_complete() const { return crypto && crypto->is_private_key_initialized() && !shared_key.empty(); }
};

/**
 * @brief Enrollment state machine binding a locally generated RSA key to the vehicle.
 *
 * One attempt runs QR parse -> validate -> keypair -> CSR -> encrypt -> OTP trigger -> OTP
 * submit. Operations invalid for the current state are rejected with ERROR_INVALID_STATE and
 * leave the attempt untouched. A step that fails moves the attempt to FAILED and discards its
 * ephemeral data; the user must start again from the QR code. Key material from an earlier
 * successful pairing stays usable until a new attempt completes.
 */
class PairingEngine {
 public:
  static constexpr const char *VERIFY_SESSION_PATH = "/ccaraccessmgmt/api/v1/pairing/app/verify-session";
  static constexpr const char *SEND_PAIR_DATA_PATH = "/ccaraccessmgmt/api/v1/pairing/app/send-pair-data";

  static constexpr size_t SEED_BYTES = 16;
  static constexpr size_t DEVICE_ID_BYTES = 4;

  PairingEngine(std::shared_ptr<HttpAdapter> http, ClientConfig config = ClientConfig());

  // Delete copy constructor and assignment operator
  PairingEngine(const PairingEngine &) = delete;
  PairingEngine &operator=(const PairingEngine &) = delete;

  /**
   * @brief Start an attempt from QR content "K=..&ssid=..&vin=..&timeout=..[&profileId=..]".
   *
   * Allowed from IDLE, FAILED and PAIRED. Fails with ERROR_PAIRING when content is empty or a
   * required key is missing.
   */
  ApiResult<QrParams> parse_qr(const std::string &content);

  /**
   * @brief Check the QR belongs to this account's vehicle.
   *
   * VIN mismatch fails. A profileId that does not decode or does not match the user id is only
   * logged; the profile check is advisory.
   */
  ApiResult<> validate(const QrParams &params, const std::string &expected_vin,
                       const std::string &expected_user_id = "");

  // 2048-bit RSA, e=65537
  ApiResult<> generate_keypair();

  /**
   * @brief CSR with subject CN={vin}_{device_id}, OU={device_name}, SHA-256 signed.
   * @return PEM text
   */
  ApiResult<std::string> generate_csr(const std::string &vin, const std::string &device_id,
                                      const std::string &device_name);

  /**
   * @brief Prepare the enrollment payload with a fresh random seed.
   * @see encrypt_csr_with_seed
   */
  ApiResult<EncryptedCsr> encrypt_csr(const std::string &csr_pem, const std::string &qr_key_b64,
                                      const std::string &vin);

  /**
   * @brief Ask the backend to send the OTP. Empty phone/email are sent as null.
   *
   * Allowed once the CSR is prepared; with retry=true it may be repeated while the OTP is pending.
   */
  ApiResult<> verify_session(const std::string &access_token, const std::string &session_id,
                             const std::string &phone = "", const std::string &email = "", bool retry = false);

  /**
   * @brief Submit the OTP with the enrollment payload.
   *
   * On 200 the attempt becomes PAIRED. A response without base64EncryptedShareKey still pairs
   * but leaves the share key unset, so is_paired() stays false.
   * @return The response's data member
   */
  ApiResult<nlohmann::json> send_pair_data(const std::string &access_token, const std::string &encrypted_csr,
                                           const std::string &otp, const std::string &seed,
                                           const std::string &session_id, const std::string &phone = "",
                                           const std::string &email = "");

  // Empty material unless a pairing completed or was imported
  PairingKeyMaterial export_keys() const;

  /**
   * @brief Restore signing capability from persisted material.
   * @return false on any decode error; the engine is then unpaired.
   */
  bool import_keys(const PairingKeyMaterial &material);

  // Paired with both a private key and a share key
  bool is_paired() const;

  SigningKeys signing_keys() const;

  // Abandon the current attempt, keeping any earlier key material
  void reset();

  // Drop key material and any attempt
  void unpair();

  // 8 lowercase hex characters
  ApiResult<std::string> generate_device_id();

  PairingState state() const;
  std::string failure_reason() const;
  std::string session_id() const;

  // Pure helpers, exposed for reuse and testing
  static ApiResult<QrParams> parse_qr_content(const std::string &content);
  static ApiResult<> validate_qr_params(const QrParams &params, const std::string &expected_vin,
                                        const std::string &expected_user_id);
  // Backslash-escape , = + < > # ; the result is stored literally as the OU value
  static std::string escape_dn_value(const std::string &value);
  // CN is "<vin>_<device_id>" as is, OU is the escaped device name
  static CsrSubject build_csr_subject(const std::string &vin, const std::string &device_id,
                                      const std::string &device_name);

  /**
   * @brief Enrollment payload for a given seed.
   *
   * The seed's hex text is used as UTF-8 bytes. An HMAC-SHA256 key over vin ++ seed is derived
   * from the QR key, but the backend has only been observed to accept the base64 plaintext
   * CSR, which is what is returned.
   */
  static ApiResult<EncryptedCsr> encrypt_csr_with_seed(const std::string &csr_pem, const std::string &qr_key_b64,
                                                       const std::string &vin, const std::string &seed_hex);

 private:
  // Ephemeral data of one attempt
  struct PairingSession {
    QrParams params;
    std::string vin;
    std::string user_id;
    std::shared_ptr<CryptoContext> crypto;
    std::string private_key_pem;
    std::string csr_pem;
    EncryptedCsr encrypted;
    std::string session_id;
  };

  std::shared_ptr<HttpAdapter> http_;
  ClientConfig config_;

  mutable std::mutex mutex_;
  PairingState state_ = PairingState::IDLE;
  std::string failure_reason_;
  std::unique_ptr<PairingSession> attempt_;

  // Durable material
  bool has_material_ = false;
  std::shared_ptr<CryptoContext> crypto_;
  std::string private_key_pem_;
  std::vector<uint8_t> shared_key_;
  std::string shared_key_b64_;
  std::string session_id_;

  std::unique_ptr<ApiError> check_state_(const char *operation, std::initializer_list<PairingState> allowed) const;
  std::unique_ptr<ApiError> fail_(std::unique_ptr<ApiError> error);
  HttpResponse post_(const std::string &access_token, const std::string &path, const nlohmann::json &payload);
  void clear_material_();
  static nlohmann::json optional_string_(const std::string &value);
};

}  // namespace VinFastCloud
