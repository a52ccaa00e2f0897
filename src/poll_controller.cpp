#ifndef VINFAST_LOG_TAG
#define VINFAST_LOG_TAG "VinFastCloud::Poll"
#endif

#include "poll_controller.h"

#include <utility>

#include "defs.h"

namespace VinFastCloud {

PollController::PollController(std::shared_ptr<SchedulerAdapter> scheduler,
                               std::shared_ptr<StateTrackerAdapter> tracker, PollConfig config)
    : scheduler_(std::move(scheduler)),
      tracker_(std::move(tracker)),
      config_(std::move(config)),
      current_interval_(config_.normal_interval_seconds) {}

PollController::~PollController() { unsubscribe(); }

uint32_t PollController::interval_for(bool charging, const PollConfig &config) {
  return charging ? config.charging_interval_seconds : config.normal_interval_seconds;
}

PollDecision PollController::evaluate(bool was_charging, const std::string &new_state, const PollConfig &config) {
  PollDecision decision;
  decision.is_charging = new_state == config.charging_state;
  decision.changed = decision.is_charging != was_charging;
  decision.interval_seconds = interval_for(decision.is_charging, config);
  decision.refresh_now = decision.changed && decision.is_charging;
  return decision;
}

// Caller holds mutex_
void PollController::apply_interval_(uint32_t seconds) {
  current_interval_ = seconds;
  if (scheduler_ && scheduler_->get_interval_seconds() != seconds) {
    scheduler_->set_interval_seconds(seconds);
  }
}

void PollController::setup() {
  if (config_.charger_entity.empty()) {
    LOG_DEBUG("No charger entity configured, skipping charger listener");
    return;
  }
  if (!tracker_) {
    LOG_WARNING("No state tracker available, dynamic polling disabled");
    return;
  }

  // Re-running setup replaces the previous subscription
  unsubscribe();

  std::string state;
  if (tracker_->get_state(config_.charger_entity, state)) {
    std::lock_guard<std::mutex> guard(mutex_);
    is_charging_ = state == config_.charging_state;
    apply_interval_(interval_for(is_charging_, config_));
    LOG_DEBUG("Initial charger state: %s (charging=%s)", state.c_str(), is_charging_ ? "true" : "false");
  }

  auto handle = tracker_->subscribe(
      config_.charger_entity,
      [this](const std::string *old_state, const std::string &new_state) { on_state_changed(old_state, new_state); });
  if (handle == StateTrackerAdapter::INVALID_HANDLE) {
    LOG_WARNING("Failed to subscribe to %s", config_.charger_entity.c_str());
    return;
  }

  std::lock_guard<std::mutex> guard(mutex_);
  subscription_ = handle;
  LOG_DEBUG("Listening for charger state changes on %s", config_.charger_entity.c_str());
}

void PollController::on_state_changed(const std::string *old_state, const std::string &new_state) {
  PollDecision decision;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    decision = evaluate(is_charging_, new_state, config_);
    if (!decision.changed) {
      return;
    }
    is_charging_ = decision.is_charging;
    apply_interval_(decision.interval_seconds);
  }

  LOG_DEBUG("Charger state changed: %s -> %s (charging=%s, interval=%us)", old_state ? old_state->c_str() : "unknown",
            new_state.c_str(), decision.is_charging ? "true" : "false", decision.interval_seconds);

  if (decision.refresh_now && scheduler_) {
    scheduler_->request_refresh();
  }
}

void PollController::unsubscribe() {
  StateTrackerAdapter::SubscriptionHandle handle;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    handle = subscription_;
    subscription_ = StateTrackerAdapter::INVALID_HANDLE;
  }
  if (handle != StateTrackerAdapter::INVALID_HANDLE && tracker_) {
    tracker_->unsubscribe(handle);
  }
}

bool PollController::is_charging() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return is_charging_;
}

uint32_t PollController::current_interval() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return current_interval_;
}

bool PollController::is_subscribed() const {
  std::lock_guard<std::mutex> guard(mutex_);
  return subscription_ != StateTrackerAdapter::INVALID_HANDLE;
}

}  // namespace VinFastCloud
