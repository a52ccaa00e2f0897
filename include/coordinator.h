#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "api_error.h"
#include "client.h"
#include "config.h"

namespace VinFastCloud {

/**
 * @brief Runs one poll cycle against a Client and keeps the latest aggregate.
 *
 * The host's scheduler calls refresh_now() on every tick and whenever the PollController asks
 * for an immediate refresh.
 */
class DataCoordinator {
 public:
  DataCoordinator(Client &client, Credentials credentials);

  // Delete copy constructor and assignment operator
  DataCoordinator(const DataCoordinator &) = delete;
  DataCoordinator &operator=(const DataCoordinator &) = delete;

  /**
   * @brief Authenticate if needed, then fetch everything.
   *
   * A refreshed token reruns the fetch once; an expired session re-authenticates with the
   * stored credentials and reruns once.
   *
   * @return The authentication error when login fails or the session stays expired,
   *         success otherwise (partial failures are listed in the aggregate)
   */
  ApiResult<> refresh_now();

  // Null until the first successful cycle
  std::shared_ptr<const AllData> last_data() const;

  uint32_t cycle_count() const;

 private:
  Client &client_;
  Credentials credentials_;

  // Serializes cycles
  std::mutex cycle_mutex_;

  mutable std::mutex data_mutex_;
  std::shared_ptr<const AllData> last_data_;
  uint32_t cycles_ = 0;

  ApiResult<> authenticate_();
};

}  // namespace VinFastCloud
