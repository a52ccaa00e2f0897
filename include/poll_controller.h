#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "adapters.h"
#include "config.h"

namespace VinFastCloud {

struct PollDecision {
  bool is_charging = false;
  // Charging flag flipped, so the interval must be reapplied
  bool changed = false;
  uint32_t interval_seconds = 0;
  // Only on a not-charging -> charging transition
  bool refresh_now = false;
};

/**
 * @brief Adapts the host's polling period to an external charging signal.
 *
 * Polls slowly by default and quickly while the configured charger entity reports the
 * charging state. The controller never owns a timer: it sets the period on the scheduler and
 * asks for one immediate refresh when charging starts.
 */
class PollController {
 public:
  PollController(std::shared_ptr<SchedulerAdapter> scheduler, std::shared_ptr<StateTrackerAdapter> tracker,
                 PollConfig config = PollConfig());
  ~PollController();

  // Delete copy constructor and assignment operator
  PollController(const PollController &) = delete;
  PollController &operator=(const PollController &) = delete;

  /**
   * @brief Pure transition function.
   * @param was_charging Charging flag before the notification
   * @param new_state Reported entity state, compared verbatim with config.charging_state
   */
  static PollDecision evaluate(bool was_charging, const std::string &new_state, const PollConfig &config);

  static uint32_t interval_for(bool charging, const PollConfig &config);

  /**
   * @brief Read the entity once, apply its state, then subscribe to changes.
   *
   * No-op when no charger entity is configured.
   */
  void setup();

  // Entry point for state-change notifications; old_state may be nullptr
  void on_state_changed(const std::string *old_state, const std::string &new_state);

  // Idempotent, safe before or without setup()
  void unsubscribe();

  bool is_charging() const;
  uint32_t current_interval() const;
  bool is_subscribed() const;

 private:
  std::shared_ptr<SchedulerAdapter> scheduler_;
  std::shared_ptr<StateTrackerAdapter> tracker_;
  PollConfig config_;

  mutable std::mutex mutex_;
  bool is_charging_ = false;
  uint32_t current_interval_;
  StateTrackerAdapter::SubscriptionHandle subscription_ = StateTrackerAdapter::INVALID_HANDLE;

  void apply_interval_(uint32_t seconds);
};

}  // namespace VinFastCloud
