#ifndef VINFAST_LOG_TAG
#define VINFAST_LOG_TAG "VinFastCloud::Pairing"
#endif

#include "pairing_engine.h"

#include <array>
#include <utility>

#include "defs.h"
#include "errors.h"
#include "vf_utils.h"

namespace VinFastCloud {

namespace {
const char *const REQUIRED_QR_KEYS[] = {"K", "ssid", "vin", "timeout"};
}  // namespace

const char *pairing_state_to_string(PairingState state) {
  switch (state) {
    case PairingState::IDLE:
      return "IDLE";
    case PairingState::QR_PARSED:
      return "QR_PARSED";
    case PairingState::VALIDATED:
      return "VALIDATED";
    case PairingState::KEYS_GENERATED:
      return "KEYS_GENERATED";
    case PairingState::CSR_READY:
      return "CSR_READY";
    case PairingState::ENCRYPTED_READY:
      return "ENCRYPTED_READY";
    case PairingState::OTP_TRIGGERED:
      return "OTP_TRIGGERED";
    case PairingState::PAIRED:
      return "PAIRED";
    case PairingState::FAILED:
      return "FAILED";
    default:
      return "UNKNOWN";
  }
}

nlohmann::json PairingKeyMaterial::to_json() const {
  return {{"private_key_pem", private_key_pem}, {"shared_key_b64", shared_key_b64}, {"session_id", session_id}};
}

PairingKeyMaterial PairingKeyMaterial::from_json(const nlohmann::json &json) {
  PairingKeyMaterial material;
  if (!json.is_object()) {
    return material;
  }
  auto read = [&json](const char *key) {
    auto it = json.find(key);
    return (it != json.end() && it->is_string()) ? it->get<std::string>() : std::string();
  };
  material.private_key_pem = read("private_key_pem");
  material.shared_key_b64 = read("shared_key_b64");
  material.session_id = read("session_id");
  return material;
}

PairingEngine::PairingEngine(std::shared_ptr<HttpAdapter> http, ClientConfig config)
    : http_(std::move(http)), config_(std::move(config)) {}

// Pure helpers

ApiResult<QrParams> PairingEngine::parse_qr_content(const std::string &content) {
  if (content.empty()) {
    return ApiResult<QrParams>::error(ApiError::pairing("Empty QR code content"));
  }

  QrParams params;
  size_t start = 0;
  while (start <= content.size()) {
    size_t end = content.find('&', start);
    if (end == std::string::npos) {
      end = content.size();
    }
    std::string pair = content.substr(start, end - start);
    size_t eq = pair.find('=');
    if (eq != std::string::npos) {
      params[trim(pair.substr(0, eq))] = trim(pair.substr(eq + 1));
    }
    start = end + 1;
  }

  std::string missing;
  for (const char *key : REQUIRED_QR_KEYS) {
    if (params.count(key) == 0) {
      missing += missing.empty() ? key : std::string(", ") + key;
    }
  }
  if (!missing.empty()) {
    return ApiResult<QrParams>::error(ApiError::pairing("QR code missing required fields: " + missing));
  }

  return ApiResult<QrParams>::success(std::move(params));
}

ApiResult<> PairingEngine::validate_qr_params(const QrParams &params, const std::string &expected_vin,
                                              const std::string &expected_user_id) {
  auto vin_it = params.find("vin");
  std::string qr_vin = vin_it != params.end() ? vin_it->second : "";
  if (qr_vin != expected_vin) {
    return ApiResult<>::error(
        ApiError::pairing("QR VIN (" + qr_vin + ") doesn't match vehicle VIN (" + expected_vin + ")"));
  }

  auto profile_it = params.find("profileId");
  if (profile_it != params.end() && !profile_it->second.empty() && !expected_user_id.empty()) {
    std::vector<uint8_t> decoded;
    if (base64_decode(profile_it->second, decoded) != VinFastCloud_Status_E_OK) {
      LOG_WARNING("QR profileId is not valid base64, skipping profile check");
    } else if (std::string(decoded.begin(), decoded.end()) != expected_user_id) {
      // Advisory only: the pairing still proceeds
      LOG_WARNING("QR profileId does not match the account user, continuing");
    }
  }

  return ApiResult<>::success();
}

std::string PairingEngine::escape_dn_value(const std::string &value) {
  static const std::string special = ",=+<>#;";
  std::string escaped;
  escaped.reserve(value.size());
  for (char c : value) {
    if (special.find(c) != std::string::npos) {
      escaped.push_back('\\');
    }
    escaped.push_back(c);
  }
  return escaped;
}

CsrSubject PairingEngine::build_csr_subject(const std::string &vin, const std::string &device_id,
                                            const std::string &device_name) {
  CsrSubject subject;
  subject.common_name = vin + "_" + device_id;
  subject.organizational_unit = escape_dn_value(device_name);
  return subject;
}

ApiResult<EncryptedCsr> PairingEngine::encrypt_csr_with_seed(const std::string &csr_pem,
                                                             const std::string &qr_key_b64, const std::string &vin,
                                                             const std::string &seed_hex) {
  if (csr_pem.empty() || seed_hex.empty()) {
    return ApiResult<EncryptedCsr>::error(ApiError::pairing("Nothing to encrypt"));
  }

  std::vector<uint8_t> qr_key;
  if (base64_decode(qr_key_b64, qr_key) != VinFastCloud_Status_E_OK || qr_key.empty()) {
    return ApiResult<EncryptedCsr>::error(ApiError::pairing("QR key is not valid base64"));
  }

  std::string key_input = vin + seed_hex;
  std::array<uint8_t, CryptoUtils::SHA256_SIZE> key1{};
  int ret = CryptoUtils::hmac_sha256(qr_key.data(), qr_key.size(), reinterpret_cast<const uint8_t *>(key_input.data()),
                                     key_input.size(), key1.data());
  CryptoUtils::clear_sensitive_memory(qr_key.data(), qr_key.size());
  if (ret != VinFastCloud_Status_E_OK) {
    return ApiResult<EncryptedCsr>::error(ApiError::pairing("Failed to derive CSR key"));
  }
  CryptoUtils::clear_sensitive_memory(key1.data(), key1.size());
  LOG_DEBUG("CSR sent base64-encoded without encryption");

  EncryptedCsr out;
  out.encrypted_csr_b64 = base64_encode(csr_pem);
  out.seed_b64 = base64_encode(seed_hex);
  return ApiResult<EncryptedCsr>::success(std::move(out));
}

// State handling

std::unique_ptr<ApiError> PairingEngine::check_state_(const char *operation,
                                                      std::initializer_list<PairingState> allowed) const {
  for (PairingState s : allowed) {
    if (s == state_) {
      return nullptr;
    }
  }
  return ApiError::invalid_state(operation, pairing_state_to_string(state_));
}

std::unique_ptr<ApiError> PairingEngine::fail_(std::unique_ptr<ApiError> error) {
  LOG_ERROR("Pairing failed in state %s: %s", pairing_state_to_string(state_), error->message().c_str());
  state_ = PairingState::FAILED;
  failure_reason_ = error->message();
  attempt_.reset();
  return error;
}

nlohmann::json PairingEngine::optional_string_(const std::string &value) {
  return value.empty() ? nlohmann::json() : nlohmann::json(value);
}

HttpResponse PairingEngine::post_(const std::string &access_token, const std::string &path,
                                  const nlohmann::json &payload) {
  HttpRequest req;
  req.method = HttpMethod::POST;
  req.url = config_.pairing_base + path;
  req.headers = {
      {"Authorization", "Bearer " + access_token},
      {"Content-Type", "application/json"},
      {"Accept", "application/json"},
  };
  req.body = payload.dump();
  req.timeout_seconds = config_.request_timeout_seconds;
  return http_->perform(req);
}

ApiResult<QrParams> PairingEngine::parse_qr(const std::string &content) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (auto err = check_state_("parse_qr", {PairingState::IDLE, PairingState::FAILED, PairingState::PAIRED})) {
    return ApiResult<QrParams>::error(std::move(err));
  }

  auto parsed = parse_qr_content(content);
  if (parsed.is_error()) {
    return ApiResult<QrParams>::error(fail_(parsed.release_error()));
  }

  attempt_ = std::make_unique<PairingSession>();
  attempt_->params = parsed.value();
  failure_reason_.clear();
  state_ = PairingState::QR_PARSED;
  LOG_DEBUG("Pairing QR parsed for VIN %s", attempt_->params["vin"].c_str());
  return parsed;
}

ApiResult<> PairingEngine::validate(const QrParams &params, const std::string &expected_vin,
                                    const std::string &expected_user_id) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (auto err = check_state_("validate", {PairingState::QR_PARSED})) {
    return ApiResult<>::error(std::move(err));
  }

  auto result = validate_qr_params(params, expected_vin, expected_user_id);
  if (result.is_error()) {
    return ApiResult<>::error(fail_(result.release_error()));
  }

  attempt_->params = params;
  attempt_->vin = expected_vin;
  attempt_->user_id = expected_user_id;
  state_ = PairingState::VALIDATED;
  return result;
}

ApiResult<> PairingEngine::generate_keypair() {
  std::lock_guard<std::mutex> guard(mutex_);
  if (auto err = check_state_("generate_keypair", {PairingState::VALIDATED})) {
    return ApiResult<>::error(std::move(err));
  }

  auto crypto = std::make_shared<CryptoContext>();
  if (crypto->create_private_key() != VinFastCloud_Status_E_OK) {
    return ApiResult<>::error(fail_(ApiError::pairing("Failed to generate RSA key pair")));
  }
  std::string pem;
  if (crypto->get_private_key_pem(pem) != VinFastCloud_Status_E_OK) {
    return ApiResult<>::error(fail_(ApiError::pairing("Failed to export private key")));
  }

  attempt_->crypto = std::move(crypto);
  attempt_->private_key_pem = std::move(pem);
  state_ = PairingState::KEYS_GENERATED;
  LOG_DEBUG("Generated %u-bit RSA key pair", CryptoContext::RSA_KEY_BITS);
  return ApiResult<>::success();
}

ApiResult<std::string> PairingEngine::generate_csr(const std::string &vin, const std::string &device_id,
                                                   const std::string &device_name) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (auto err = check_state_("generate_csr", {PairingState::KEYS_GENERATED})) {
    return ApiResult<std::string>::error(std::move(err));
  }
  if (vin.empty() || device_id.empty()) {
    return ApiResult<std::string>::error(fail_(ApiError::pairing("CSR needs a VIN and a device id")));
  }

  CsrSubject subject = build_csr_subject(vin, device_id, device_name);
  std::string csr;
  if (attempt_->crypto->generate_csr(subject, csr) != VinFastCloud_Status_E_OK) {
    return ApiResult<std::string>::error(fail_(ApiError::pairing("Failed to build CSR for " + subject.common_name)));
  }

  attempt_->csr_pem = csr;
  state_ = PairingState::CSR_READY;
  return ApiResult<std::string>::success(std::move(csr));
}

ApiResult<EncryptedCsr> PairingEngine::encrypt_csr(const std::string &csr_pem, const std::string &qr_key_b64,
                                                   const std::string &vin) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (auto err = check_state_("encrypt_csr", {PairingState::CSR_READY})) {
    return ApiResult<EncryptedCsr>::error(std::move(err));
  }

  std::array<uint8_t, SEED_BYTES> seed{};
  if (attempt_->crypto->generate_random_bytes(seed.data(), seed.size()) != VinFastCloud_Status_E_OK) {
    return ApiResult<EncryptedCsr>::error(fail_(ApiError::pairing("Failed to generate seed")));
  }

  auto result = encrypt_csr_with_seed(csr_pem, qr_key_b64, vin, bytes_to_hex_string(seed.data(), seed.size()));
  if (result.is_error()) {
    return ApiResult<EncryptedCsr>::error(fail_(result.release_error()));
  }

  attempt_->encrypted = result.value();
  state_ = PairingState::ENCRYPTED_READY;
  return result;
}

ApiResult<> PairingEngine::verify_session(const std::string &access_token, const std::string &session_id,
                                          const std::string &phone, const std::string &email, bool retry) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (retry) {
    if (auto err = check_state_("verify_session", {PairingState::ENCRYPTED_READY, PairingState::OTP_TRIGGERED})) {
      return ApiResult<>::error(std::move(err));
    }
  } else if (auto err = check_state_("verify_session", {PairingState::ENCRYPTED_READY})) {
    return ApiResult<>::error(std::move(err));
  }

  nlohmann::json payload = {
      {"ssid", session_id},
      {"phoneNumber", optional_string_(phone)},
      {"email", optional_string_(email)},
      {"retry", retry},
  };

  HttpResponse resp = post_(access_token, VERIFY_SESSION_PATH, payload);
  if (!resp.transport_ok) {
    return ApiResult<>::error(fail_(ApiError::pairing("Connection error: " + resp.error)));
  }
  if (resp.status != 200) {
    return ApiResult<>::error(fail_(
        ApiError::pairing("Verify session failed: " + resp.body, static_cast<int>(resp.status), resp.body)));
  }

  attempt_->session_id = session_id;
  state_ = PairingState::OTP_TRIGGERED;
  LOG_INFO("Verify session successful - OTP sent");
  return ApiResult<>::success();
}

ApiResult<nlohmann::json> PairingEngine::send_pair_data(const std::string &access_token,
                                                        const std::string &encrypted_csr, const std::string &otp,
                                                        const std::string &seed, const std::string &session_id,
                                                        const std::string &phone, const std::string &email) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (auto err = check_state_("send_pair_data", {PairingState::OTP_TRIGGERED})) {
    return ApiResult<nlohmann::json>::error(std::move(err));
  }

  nlohmann::json payload = {
      {"encryptedCSR", encrypted_csr},
      {"otp", otp},
      {"phoneNumber", optional_string_(phone)},
      {"email", optional_string_(email)},
      {"seed", seed},
      {"sessionId", session_id},
  };

  HttpResponse resp = post_(access_token, SEND_PAIR_DATA_PATH, payload);
  if (!resp.transport_ok) {
    return ApiResult<nlohmann::json>::error(fail_(ApiError::pairing("Connection error: " + resp.error)));
  }
  if (resp.status != 200) {
    return ApiResult<nlohmann::json>::error(
        fail_(ApiError::pairing("Pairing failed: " + resp.body, static_cast<int>(resp.status), resp.body)));
  }

  nlohmann::json data = nlohmann::json::object();
  try {
    auto body = nlohmann::json::parse(resp.body);
    if (body.is_object() && body.contains("data") && body["data"].is_object()) {
      data = body["data"];
    }
  } catch (const nlohmann::json::parse_error &e) {
    return ApiResult<nlohmann::json>::error(
        fail_(ApiError::pairing(std::string("Undecodable pairing response: ") + e.what())));
  }

  // Promote the attempt to durable material
  crypto_ = attempt_->crypto;
  private_key_pem_ = attempt_->private_key_pem;
  session_id_ = session_id;
  shared_key_.clear();
  shared_key_b64_.clear();

  auto share_key = data.find("base64EncryptedShareKey");
  if (share_key != data.end() && share_key->is_string() && !share_key->get<std::string>().empty()) {
    shared_key_b64_ = share_key->get<std::string>();
    if (base64_decode(shared_key_b64_, shared_key_) != VinFastCloud_Status_E_OK) {
      LOG_WARNING("Failed to decode shared key");
      shared_key_.clear();
    }
  } else {
    LOG_WARNING("Pairing response carried no share key; commands cannot be signed");
  }

  has_material_ = true;
  attempt_.reset();
  state_ = PairingState::PAIRED;
  LOG_INFO("Pairing successful");
  return ApiResult<nlohmann::json>::success(std::move(data));
}

PairingKeyMaterial PairingEngine::export_keys() const {
  std::lock_guard<std::mutex> guard(mutex_);
  PairingKeyMaterial material;
  if (!has_material_) {
    return material;
  }
  material.private_key_pem = private_key_pem_;
  material.shared_key_b64 = shared_key_b64_;
  material.session_id = session_id_;
  return material;
}

bool PairingEngine::import_keys(const PairingKeyMaterial &material) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (attempt_) {
    LOG_WARNING("Cannot import keys while a pairing attempt is in progress");
    return false;
  }

  clear_material_();
  if (material.private_key_pem.empty() || material.shared_key_b64.empty()) {
    state_ = PairingState::IDLE;
    return false;
  }

  auto crypto = std::make_shared<CryptoContext>();
  if (crypto->load_private_key(material.private_key_pem) != VinFastCloud_Status_E_OK) {
    LOG_ERROR("Failed to import keys: private key does not parse");
    state_ = PairingState::IDLE;
    return false;
  }
  std::vector<uint8_t> shared_key;
  if (base64_decode(material.shared_key_b64, shared_key) != VinFastCloud_Status_E_OK || shared_key.empty()) {
    LOG_ERROR("Failed to import keys: shared key is not valid base64");
    state_ = PairingState::IDLE;
    return false;
  }

  crypto_ = std::move(crypto);
  private_key_pem_ = material.private_key_pem;
  shared_key_ = std::move(shared_key);
  shared_key_b64_ = material.shared_key_b64;
  session_id_ = material.session_id;
  has_material_ = true;
  state_ = PairingState::PAIRED;
  LOG_INFO("Pairing keys imported successfully");
  return true;
}

bool PairingEngine::is_paired() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return has_material_ && crypto_ && crypto_->is_private_key_initialized() && !shared_key_.empty();
}

SigningKeys PairingEngine::signing_keys() const {
  std::lock_guard<std::mutex> guard(mutex_);
  SigningKeys keys;
  if (has_material_) {
    keys.crypto = crypto_;
    keys.shared_key = shared_key_;
    keys.session_id = session_id_;
  }
  return keys;
}

void PairingEngine::reset() {
  std::lock_guard<std::mutex> guard(mutex_);
  attempt_.reset();
  failure_reason_.clear();
  state_ = has_material_ ? PairingState::PAIRED : PairingState::IDLE;
}

void PairingEngine::clear_material_() {
  has_material_ = false;
  crypto_.reset();
  CryptoUtils::clear_sensitive_memory(&private_key_pem_[0], private_key_pem_.size());
  private_key_pem_.clear();
  if (!shared_key_.empty()) {
    CryptoUtils::clear_sensitive_memory(shared_key_.data(), shared_key_.size());
  }
  shared_key_.clear();
  shared_key_b64_.clear();
  session_id_.clear();
}

void PairingEngine::unpair() {
  std::lock_guard<std::mutex> guard(mutex_);
  attempt_.reset();
  clear_material_();
  failure_reason_.clear();
  state_ = PairingState::IDLE;
}

ApiResult<std::string> PairingEngine::generate_device_id() {
  std::shared_ptr<CryptoContext> rng;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    rng = attempt_ && attempt_->crypto ? attempt_->crypto : std::make_shared<CryptoContext>();
  }

  std::array<uint8_t, DEVICE_ID_BYTES> bytes{};
  if (rng->generate_random_bytes(bytes.data(), bytes.size()) != VinFastCloud_Status_E_OK) {
    return ApiResult<std::string>::error(ApiError::crypto("Failed to generate device id"));
  }
  return ApiResult<std::string>::success(bytes_to_hex_string(bytes.data(), bytes.size()));
}

PairingState PairingEngine::state() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return state_;
}

std::string PairingEngine::failure_reason() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return failure_reason_;
}

std::string PairingEngine::session_id() const {
  std::lock_guard<std::mutex> guard(mutex_);
  if (attempt_ && !attempt_->session_id.empty()) {
    return attempt_->session_id;
  }
  return session_id_;
}

}  // namespace VinFastCloud
