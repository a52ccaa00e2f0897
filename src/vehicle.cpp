#ifndef VINFAST_LOG_TAG
#define VINFAST_LOG_TAG "VinFastCloud::Vehicle"
#endif

#include "vehicle.h"

#include <utility>
#include <vector>

#include "defs.h"
#include "errors.h"
#include "message_builders.h"
#include "vf_utils.h"

namespace VinFastCloud {

Vehicle::Vehicle(std::shared_ptr<HttpAdapter> http, std::shared_ptr<StorageAdapter> storage,
                 std::shared_ptr<ClockAdapter> clock, ClientConfig config)
    : storage_adapter_(std::move(storage)),
      config_(std::move(config)),
      client_(std::make_unique<Client>(http, config_)),
      pairing_(std::make_unique<PairingEngine>(http, config_)),
      signer_(std::make_unique<CommandSigner>(http, std::move(clock), config_)) {
  // Restore signing capability from a previous pairing
  load_keys_from_storage_();
}

void Vehicle::load_keys_from_storage_() {
  if (!storage_adapter_) {
    return;
  }

  std::vector<uint8_t> buffer;
  if (!storage_adapter_->load(STORAGE_KEY, buffer)) {
    LOG_INFO("No pairing keys found in storage");
    return;
  }

  nlohmann::json stored;
  try {
    stored = nlohmann::json::parse(buffer.begin(), buffer.end());
  } catch (const nlohmann::json::parse_error &e) {
    LOG_ERROR("Stored pairing keys are not valid JSON: %s", e.what());
    return;
  }

  if (pairing_->import_keys(PairingKeyMaterial::from_json(stored))) {
    LOG_INFO("Loaded pairing keys from storage");
  } else {
    LOG_WARNING("Failed to load pairing keys");
  }
  CryptoUtils::clear_sensitive_memory(buffer.data(), buffer.size());
}

bool Vehicle::persist_keys_(const PairingKeyMaterial &material) {
  if (!storage_adapter_) {
    return false;
  }
  std::string text = material.to_json().dump();
  std::vector<uint8_t> buffer(text.begin(), text.end());
  bool saved = storage_adapter_->save(STORAGE_KEY, buffer);
  CryptoUtils::clear_sensitive_memory(&text[0], text.size());
  CryptoUtils::clear_sensitive_memory(buffer.data(), buffer.size());
  return saved;
}

ApiResult<> Vehicle::start_pairing(const std::string &qr_content, const std::string &device_name,
                                   const std::string &phone, const std::string &email) {
  auto session = client_->session();
  if (!session->is_authenticated()) {
    return ApiResult<>::error(ApiError::invalid_state("start_pairing", "UNAUTHENTICATED"));
  }
  cancel_pairing();

  if (session->vin().empty()) {
    auto vehicles = client_->get_vehicles();
    if (vehicles.is_error()) {
      return ApiResult<>::error(vehicles.release_error());
    }
  }
  const std::string vin = session->vin();
  if (vin.empty()) {
    return ApiResult<>::error(ApiError::pairing("No vehicle on this account"));
  }

  auto params = pairing_->parse_qr(qr_content);
  if (params.is_error()) {
    return ApiResult<>::error(params.release_error());
  }

  auto validated = pairing_->validate(params.value(), vin, session->user_id());
  if (validated.is_error()) {
    return validated;
  }

  auto keypair = pairing_->generate_keypair();
  if (keypair.is_error()) {
    return keypair;
  }

  auto device_id = pairing_->generate_device_id();
  if (device_id.is_error()) {
    pairing_->reset();
    return ApiResult<>::error(device_id.release_error());
  }

  const std::string name = device_name.empty() ? config_.device_platform : device_name;
  auto csr = pairing_->generate_csr(vin, device_id.value(), name);
  if (csr.is_error()) {
    return ApiResult<>::error(csr.release_error());
  }

  auto encrypted = pairing_->encrypt_csr(csr.value(), params.value()["K"], vin);
  if (encrypted.is_error()) {
    return ApiResult<>::error(encrypted.release_error());
  }

  const std::string session_id = params.value()["ssid"];
  auto otp = pairing_->verify_session(session->access_token(), session_id, phone, email, false);
  if (otp.is_error()) {
    return otp;
  }

  auto pending = std::make_unique<PendingPairing>();
  pending->session_id = session_id;
  pending->device_id = device_id.value();
  pending->encrypted_csr_b64 = encrypted.value().encrypted_csr_b64;
  pending->seed_b64 = encrypted.value().seed_b64;

  std::lock_guard<std::mutex> guard(pending_mutex_);
  pending_ = std::move(pending);
  LOG_INFO("Pairing started, waiting for OTP");
  LOG_DEBUG("Pairing VIN: %s", vin.c_str());
  return ApiResult<>::success();
}

ApiResult<> Vehicle::resend_otp(const std::string &phone, const std::string &email) {
  std::string session_id;
  {
    std::lock_guard<std::mutex> guard(pending_mutex_);
    if (!pending_) {
      return ApiResult<>::error(ApiError::invalid_state("resend_otp", pairing_state_to_string(pairing_->state())));
    }
    session_id = pending_->session_id;
  }
  return pairing_->verify_session(client_->session()->access_token(), session_id, phone, email, true);
}

ApiResult<> Vehicle::complete_pairing(const std::string &otp, const std::string &phone, const std::string &email) {
  if (otp.empty()) {
    return ApiResult<>::error(ApiError::invalid_params("OTP is required"));
  }

  std::unique_ptr<PendingPairing> pending;
  {
    std::lock_guard<std::mutex> guard(pending_mutex_);
    if (!pending_) {
      return ApiResult<>::error(
          ApiError::invalid_state("complete_pairing", pairing_state_to_string(pairing_->state())));
    }
    pending = std::move(pending_);
  }

  auto response = pairing_->send_pair_data(client_->session()->access_token(), pending->encrypted_csr_b64, otp,
                                           pending->seed_b64, pending->session_id, phone, email);
  if (response.is_error()) {
    return ApiResult<>::error(response.release_error());
  }

  PairingKeyMaterial material = pairing_->export_keys();
  if (!persist_keys_(material)) {
    LOG_ERROR("Failed to persist pairing keys");
    return ApiResult<>::error(std::make_unique<ApiError>(VinFastCloud_Status_E_ERROR_INTERNAL,
                                                         "Paired, but the keys could not be saved"));
  }

  if (!pairing_->is_paired()) {
    LOG_WARNING("Paired without a usable share key; commands will be rejected");
  }
  LOG_INFO("Pairing completed (device %s)", pending->device_id.c_str());
  return ApiResult<>::success();
}

void Vehicle::cancel_pairing() {
  bool had_pending;
  {
    std::lock_guard<std::mutex> guard(pending_mutex_);
    had_pending = pending_ != nullptr;
    pending_.reset();
  }
  pairing_->reset();
  if (had_pending) {
    LOG_INFO("Pending pairing cancelled");
  }
}

void Vehicle::unpair() {
  {
    std::lock_guard<std::mutex> guard(pending_mutex_);
    pending_.reset();
  }
  pairing_->unpair();
  if (storage_adapter_) {
    storage_adapter_->remove(STORAGE_KEY);
  }
  LOG_INFO("Pairing keys removed");
}

ApiResult<> Vehicle::send_command(const std::string &alias, const nlohmann::json &value) {
  if (!pairing_->is_paired()) {
    LOG_ERROR("Cannot send %s - not paired", alias.c_str());
    return ApiResult<>::error(ApiError::not_paired());
  }

  nlohmann::json content;
  if (ControlCommandBuilder::build_control_content(alias, value, content) != VinFastCloud_Status_E_OK) {
    return ApiResult<>::error(ApiError::invalid_params("Unknown control alias: " + alias));
  }

  auto session = client_->session();
  SigningKeys keys = pairing_->signing_keys();
  auto signed_command = signer_->sign(keys, alias, content, session->user_id(), keys.session_id);
  if (signed_command.is_error()) {
    return ApiResult<>::error(signed_command.release_error());
  }

  if (!signer_->dispatch(session->access_token(), signed_command.value())) {
    return ApiResult<>::error(
        std::make_unique<ApiError>(VinFastCloud_Status_E_ERROR_PROTOCOL, "Command " + alias + " was not accepted"));
  }
  return ApiResult<>::success();
}

ApiResult<> Vehicle::set_climate(bool enable) {
  return send_command(ControlCommandBuilder::CLIMATE_AIR_CONDITION, enable ? 1 : 0);
}

ApiResult<> Vehicle::set_climate_temperature(double celsius) {
  return send_command(ControlCommandBuilder::CLIMATE_TARGET_TEMPERATURE, celsius);
}

ApiResult<> Vehicle::lock() { return send_command(ControlCommandBuilder::DOOR_LOCK, 1); }

ApiResult<> Vehicle::unlock() { return send_command(ControlCommandBuilder::DOOR_UNLOCK, 1); }

ApiResult<> Vehicle::honk_horn() { return send_command(ControlCommandBuilder::HORN, 1); }

ApiResult<> Vehicle::flash_lights() { return send_command(ControlCommandBuilder::LIGHTS, 1); }

}  // namespace VinFastCloud
