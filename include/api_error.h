#pragma once

#include <cassert>
#include <memory>
#include <string>
#include <utility>

#include "errors.h"

namespace VinFastCloud {

/**
 * Rich error for cloud calls.
 * Carries the status kind plus whatever the server said, so callers can decide between
 * retrying, re-authenticating or restarting a pairing attempt.
 */
class ApiError {
 public:
  ApiError(VinFastCloud_Status_E status, std::string message, int http_status = 0, std::string body = "")
      : status_(status), message_(std::move(message)), http_status_(http_status), body_(std::move(body)) {}

  // Protocol and transport failures may go away on their own; auth and pairing failures need user action.
  bool is_temporary() const {
    return status_ == VinFastCloud_Status_E_ERROR_PROTOCOL || status_ == VinFastCloud_Status_E_ERROR_JSON_DECODING ||
           status_ == VinFastCloud_Status_E_ERROR_RETRY_AFTER_REFRESH;
  }
  bool requires_reauthentication() const {
    return status_ == VinFastCloud_Status_E_ERROR_AUTH || status_ == VinFastCloud_Status_E_ERROR_AUTH_EXPIRED;
  }

  VinFastCloud_Status_E status() const { return status_; }
  const std::string &message() const { return message_; }
  int http_status() const { return http_status_; }
  const std::string &body() const { return body_; }

  std::string to_string() const {
    std::string out = std::string(VinFastCloud_Status_to_string(status_)) + ": " + message_;
    if (http_status_ != 0) {
      out += " (HTTP " + std::to_string(http_status_) + ")";
    }
    return out;
  }

  // Factory methods for the error kinds the protocol produces
  static std::unique_ptr<ApiError> auth_failed(const std::string &context) {
    return std::make_unique<ApiError>(VinFastCloud_Status_E_ERROR_AUTH, context + ": invalid credentials", 401);
  }

  static std::unique_ptr<ApiError> auth_expired() {
    return std::make_unique<ApiError>(VinFastCloud_Status_E_ERROR_AUTH_EXPIRED, "Authentication expired", 401);
  }

  static std::unique_ptr<ApiError> retry_after_refresh() {
    return std::make_unique<ApiError>(VinFastCloud_Status_E_ERROR_RETRY_AFTER_REFRESH,
                                      "Token refreshed, retry request", 401);
  }

  static std::unique_ptr<ApiError> http_status_error(const std::string &context, int http_status,
                                                     const std::string &body) {
    return std::make_unique<ApiError>(VinFastCloud_Status_E_ERROR_PROTOCOL,
                                      context + " failed with status " + std::to_string(http_status), http_status,
                                      body);
  }

  static std::unique_ptr<ApiError> transport(const std::string &context, const std::string &detail) {
    return std::make_unique<ApiError>(VinFastCloud_Status_E_ERROR_PROTOCOL, context + " transport error: " + detail);
  }

  static std::unique_ptr<ApiError> application(const std::string &message) {
    return std::make_unique<ApiError>(VinFastCloud_Status_E_ERROR_PROTOCOL, "API error: " + message, 200);
  }

  static std::unique_ptr<ApiError> malformed(const std::string &context) {
    return std::make_unique<ApiError>(VinFastCloud_Status_E_ERROR_JSON_DECODING, context + ": malformed response");
  }

  static std::unique_ptr<ApiError> pairing(const std::string &message, int http_status = 0,
                                           const std::string &body = "") {
    return std::make_unique<ApiError>(VinFastCloud_Status_E_ERROR_PAIRING, message, http_status, body);
  }

  static std::unique_ptr<ApiError> not_paired() {
    return std::make_unique<ApiError>(VinFastCloud_Status_E_ERROR_NOT_PAIRED, "Not paired - cannot sign commands");
  }

  static std::unique_ptr<ApiError> invalid_state(const std::string &operation, const char *state) {
    return std::make_unique<ApiError>(VinFastCloud_Status_E_ERROR_INVALID_STATE,
                                      operation + " not allowed in state " + state);
  }

  static std::unique_ptr<ApiError> invalid_params(const std::string &message) {
    return std::make_unique<ApiError>(VinFastCloud_Status_E_ERROR_INVALID_PARAMS, message);
  }

  static std::unique_ptr<ApiError> crypto(const std::string &message) {
    return std::make_unique<ApiError>(VinFastCloud_Status_E_ERROR_CRYPTO, message);
  }

 private:
  VinFastCloud_Status_E status_;
  std::string message_;
  int http_status_;
  std::string body_;
};

// Result type for operations that can return a value or a rich error
template<typename T = void> class ApiResult {
 public:
  static ApiResult success(T value = T{}) { return ApiResult(std::move(value)); }

  static ApiResult error(std::unique_ptr<ApiError> error) { return ApiResult(std::move(error)); }

  bool is_success() const { return error_ == nullptr; }
  bool is_error() const { return error_ != nullptr; }

  VinFastCloud_Status_E status() const { return error_ ? error_->status() : VinFastCloud_Status_E_OK; }

  const T &value() const {
    assert(is_success() && "Cannot get value from error result");
    return value_;
  }

  T &value() {
    assert(is_success() && "Cannot get value from error result");
    return value_;
  }

  const ApiError &error() const {
    assert(is_error() && "Cannot get error from success result");
    return *error_;
  }

  std::unique_ptr<ApiError> release_error() { return std::move(error_); }

 private:
  ApiResult(T value) : value_(std::move(value)), error_(nullptr) {}
  ApiResult(std::unique_ptr<ApiError> error) : value_(), error_(std::move(error)) {}

  T value_;
  std::unique_ptr<ApiError> error_;
};

// Specialization for void results
template<> class ApiResult<void> {
 public:
  static ApiResult success() { return ApiResult(); }

  static ApiResult error(std::unique_ptr<ApiError> error) { return ApiResult(std::move(error)); }

  bool is_success() const { return error_ == nullptr; }
  bool is_error() const { return error_ != nullptr; }

  VinFastCloud_Status_E status() const { return error_ ? error_->status() : VinFastCloud_Status_E_OK; }

  const ApiError &error() const {
    assert(is_error() && "Cannot get error from success result");
    return *error_;
  }

  std::unique_ptr<ApiError> release_error() { return std::move(error_); }

 private:
  ApiResult() : error_(nullptr) {}
  ApiResult(std::unique_ptr<ApiError> error) : error_(std::move(error)) {}

  std::unique_ptr<ApiError> error_;
};

}  // namespace VinFastCloud
