#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "procsup/failure.hpp"
#include "procsup/result.hpp"

namespace procsup {

/// @brief Generic service lifecycle states.
enum class ServiceState : std::uint8_t { not_inited, inited, started, stopped };

/// @brief Lower-case name of a state, for logs.
const char* to_string(ServiceState state) noexcept;

/// @brief Lifecycle host: owns the state machine and the fault channel.
///
/// Subclasses supply the two hooks. `stop()` moves to `stopped` before running the stop
/// hook, so a stop requested from inside the hook (or from a callback it triggers)
/// returns immediately. The first failure noted is kept and handed to the registered
/// fault handlers; later ones are dropped.
class Service {
 public:
  explicit Service(std::string name) : name_(std::move(name)) {}
  virtual ~Service() = default;
  Service(const Service&) = delete;
  Service& operator=(const Service&) = delete;

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] ServiceState state() const noexcept { return state_.load(); }
  [[nodiscard]] bool is_in_state(ServiceState expected) const noexcept {
    return state_.load() == expected;
  }

  /// @brief Move from not_inited to inited; no-op afterwards.
  Result<void> init();
  /// @brief Run the start hook. On hook failure the service is stopped and the error returned.
  Result<void> start();
  /// @brief Run the stop hook once; later calls return immediately.
  void stop();

  /// @brief Block until the stop hook has completed or the timeout elapses.
  bool wait_for_service_to_stop(std::chrono::milliseconds timeout) const;

  /// @brief The failure noted for this service, if any.
  [[nodiscard]] std::optional<FailureRecord> failure() const;
  /// @brief Register a handler invoked with the first noted failure.
  void add_fault_handler(FaultHandler handler);

 protected:
  virtual Result<void> on_service_start() = 0;
  virtual void on_service_stop() = 0;

  /// @brief Record a failure; only the first is kept and dispatched.
  void note_failure(const FailureRecord& record);

 private:
  std::string name_;
  std::atomic<ServiceState> state_{ServiceState::not_inited};

  mutable std::mutex mutex_;
  mutable std::condition_variable terminated_cv_;
  bool terminated_ = false;
  std::optional<FailureRecord> failure_;
  std::vector<FaultHandler> fault_handlers_;
};

}  // namespace procsup
