#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

// NOLINTBEGIN(cppcoreguidelines-avoid-non-const-global-variables) - False positive on namespace
namespace VinFastCloud {

enum class HttpMethod { GET, POST };

struct HttpRequest {
  HttpMethod method = HttpMethod::GET;
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
  long timeout_seconds = 30;
};

struct HttpResponse {
  // false when no HTTP exchange completed (DNS, TLS, timeout...)
  bool transport_ok = false;
  long status = 0;
  std::string body;
  std::string error;
};

/**
 * @brief Abstract interface for HTTP operations.
 *
 * Hosts implement this on top of their HTTP stack. The library ships CurlHttpAdapter.
 * Implementations must bound every call by request.timeout_seconds and must not follow redirects.
 */
class HttpAdapter {
 public:
  virtual ~HttpAdapter() = default;

  /**
   * @brief Perform a single blocking request.
   * @param request Method, URL, headers, body and timeout.
   * @return The response. Transport failures are reported through transport_ok/error, never thrown.
   */
  virtual HttpResponse perform(const HttpRequest &request) = 0;
};

/**
 * @brief Abstract interface for persistent storage.
 *
 * Used to store the pairing key material between restarts.
 */
class StorageAdapter {
 public:
  virtual ~StorageAdapter() = default;

  /**
   * @brief Load a value from storage.
   * @param key The unique key identifier.
   * @param buffer Output buffer to store the loaded data.
   * @return true if found and loaded, false otherwise.
   */
  virtual bool load(const std::string &key, std::vector<uint8_t> &buffer) = 0;

  /**
   * @brief Save a value to storage.
   * @param key The unique key identifier.
   * @param buffer The data to save.
   * @return true if saved successfully, false otherwise.
   */
  virtual bool save(const std::string &key, const std::vector<uint8_t> &buffer) = 0;

  /**
   * @brief Remove a value from storage.
   * @param key The unique key identifier.
   * @return true if removed successfully, false otherwise.
   */
  virtual bool remove(const std::string &key) = 0;
};

class ClockAdapter {
 public:
  virtual ~ClockAdapter() = default;

  // Milliseconds since the Unix epoch
  virtual int64_t now_ms() = 0;
};

/**
 * @brief Host periodic-refresh timer.
 *
 * The library never owns a timer; it only reads and adjusts the period and asks for an
 * out-of-band run.
 */
class SchedulerAdapter {
 public:
  virtual ~SchedulerAdapter() = default;

  virtual uint32_t get_interval_seconds() const = 0;
  virtual void set_interval_seconds(uint32_t seconds) = 0;

  // Schedule one refresh as soon as possible, without waiting for the period
  virtual void request_refresh() = 0;
};

/**
 * @brief Host entity state source, e.g. an OCPP charger status sensor.
 */
class StateTrackerAdapter {
 public:
  using SubscriptionHandle = uint64_t;
  static constexpr SubscriptionHandle INVALID_HANDLE = 0;

  // old_state is nullptr when the entity had no previous state
  using StateCallback = std::function<void(const std::string *old_state, const std::string &new_state)>;

  virtual ~StateTrackerAdapter() = default;

  /**
   * @brief Read the current state of an entity.
   * @return true if the entity exists and has a state.
   */
  virtual bool get_state(const std::string &entity_id, std::string &state) = 0;

  /**
   * @return A handle for unsubscribe(), or INVALID_HANDLE on failure.
   */
  virtual SubscriptionHandle subscribe(const std::string &entity_id, StateCallback callback) = 0;

  virtual void unsubscribe(SubscriptionHandle handle) = 0;
};

}  // namespace VinFastCloud
// NOLINTEND(cppcoreguidelines-avoid-non-const-global-variables)
