#ifndef VINFAST_LOG_TAG
#define VINFAST_LOG_TAG "VinFastCloud::Coordinator"
#endif

#include "coordinator.h"

#include <algorithm>
#include <utility>

#include "defs.h"
#include "errors.h"

namespace VinFastCloud {

namespace {
bool needs_reauthentication(const AllData &data) {
  return std::any_of(data.errors.begin(), data.errors.end(),
                     [](const ApiError &error) { return error.requires_reauthentication(); });
}
}  // namespace

DataCoordinator::DataCoordinator(Client &client, Credentials credentials)
    : client_(client), credentials_(std::move(credentials)) {}

ApiResult<> DataCoordinator::authenticate_() {
  auto result = client_.authenticate(credentials_.email, credentials_.password);
  if (result.is_error() && result.error().is_temporary()) {
    LOG_WARNING("Authentication unavailable, next cycle retries: %s", result.error().to_string().c_str());
  } else if (result.is_error()) {
    LOG_ERROR("Authentication failed: %s", result.error().to_string().c_str());
  }
  return result;
}

ApiResult<> DataCoordinator::refresh_now() {
  std::lock_guard<std::mutex> cycle_guard(cycle_mutex_);

  if (!client_.session()->is_authenticated()) {
    auto auth = authenticate_();
    if (auth.is_error()) {
      return auth;
    }
  }

  AllData data = client_.get_all_data();

  if (data.has_error(VinFastCloud_Status_E_ERROR_RETRY_AFTER_REFRESH)) {
    LOG_DEBUG("Token was refreshed during the cycle, fetching again");
    data = client_.get_all_data();
  } else if (needs_reauthentication(data)) {
    LOG_INFO("Session expired, re-authenticating");
    auto auth = authenticate_();
    if (auth.is_error()) {
      return auth;
    }
    data = client_.get_all_data();
  }

  if (needs_reauthentication(data)) {
    LOG_ERROR("Session still expired after re-authentication");
    return ApiResult<>::error(ApiError::auth_expired());
  }

  if (!data.errors.empty()) {
    LOG_DEBUG("Cycle finished with %zu partial failures", data.errors.size());
  }

  std::lock_guard<std::mutex> data_guard(data_mutex_);
  last_data_ = std::make_shared<const AllData>(std::move(data));
  cycles_++;
  return ApiResult<>::success();
}

std::shared_ptr<const AllData> DataCoordinator::last_data() const {
  std::lock_guard<std::mutex> guard(data_mutex_);
  return last_data_;
}

uint32_t DataCoordinator::cycle_count() const {
  std::lock_guard<std::mutex> guard(data_mutex_);
  return cycles_;
}

}  // namespace VinFastCloud
